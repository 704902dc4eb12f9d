#pragma once

#include "core/types.hpp"
#include "server/irate_limiter.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace gatekeeper {

/**
 * @brief Exact sliding-log rate limiter
 *
 * Each key owns the ordered timestamps of its accepted requests. A check
 * prunes everything older than the window, admits while fewer than
 * `limit` timestamps remain, and otherwise reports how long until the
 * oldest one expires.
 *
 * Concurrency:
 * - key map guarded by a shared_mutex (shared for lookup, unique for
 *   insert and sweep)
 * - per-entry mutex serializes prune + check + append for one key
 * - entries removed by the sweep are flagged retired; a check that
 *   raced with removal re-fetches instead of writing to an orphan
 */
class SlidingWindowRateLimiter : public IRateLimiter {
public:
    using Clock = std::function<TimestampMs()>;

    struct Config {
        // Background sweep of idle keys
        uint32_t sweep_interval_seconds = 0;   // 0 = disabled
    };

    SlidingWindowRateLimiter();
    explicit SlidingWindowRateLimiter(const Config& config, Clock clock = {});

    ~SlidingWindowRateLimiter() override;

    SlidingWindowRateLimiter(const SlidingWindowRateLimiter&) = delete;
    SlidingWindowRateLimiter& operator=(const SlidingWindowRateLimiter&) = delete;

    [[nodiscard]] RateLimitResult check(
        const std::string& key, const RateLimitConfig& config, TimestampMs now_ms) override;

    [[nodiscard]] RateLimitResult check(
        const std::string& key, const RateLimitConfig& config) override;

    /**
     * @brief Drop every key (test-only clear)
     */
    void reset_all() override;

    /**
     * @brief Prune all entries against their largest window and delete empty ones
     * @return Number of keys deleted
     *
     * Called by the background thread; public for deterministic tests.
     * Never changes an admission outcome: only timestamps that every
     * future check would prune anyway are removed.
     */
    size_t sweep(TimestampMs now_ms);

    /**
     * @brief Timestamps currently recorded for key (0 if absent)
     */
    [[nodiscard]] size_t recorded(const std::string& key) const;

    struct Stats {
        uint64_t total_checks;
        uint64_t rejects;
        uint64_t keys_swept;
        size_t tracked_keys;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    struct WindowEntry {
        std::mutex mutex;
        std::deque<TimestampMs> timestamps;
        int64_t max_window_ms = 0;
        bool retired = false;
    };

    std::shared_ptr<WindowEntry> get_entry(const std::string& key);
    void sweep_loop();

    Config config_;
    Clock clock_;

    std::unordered_map<std::string, std::shared_ptr<WindowEntry>> entries_;
    mutable std::shared_mutex entries_mutex_;

    std::atomic<uint64_t> total_checks_{0};
    std::atomic<uint64_t> rejects_{0};
    std::atomic<uint64_t> keys_swept_{0};

    std::thread sweep_thread_;
    std::atomic<bool> sweep_running_{false};
    std::mutex sweep_mutex_;
    std::condition_variable sweep_cv_;
};

} // namespace gatekeeper
