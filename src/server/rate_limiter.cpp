#include "server/rate_limiter.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <chrono>
#include <format>

namespace gatekeeper {

namespace {

// Remove every timestamp outside the window. erase_if rather than popping
// the front: a clock that stepped backwards can leave the log unordered.
void prune(std::deque<TimestampMs>& timestamps, TimestampMs now_ms, int64_t window_ms) {
    std::erase_if(timestamps, [now_ms, window_ms](TimestampMs t) {
        return now_ms - t >= window_ms;
    });
}

uint32_t retry_after_seconds(TimestampMs oldest, TimestampMs now_ms,
                             const RateLimitConfig& config) {
    const int64_t remaining_ms = oldest + config.window_ms - now_ms;
    const int64_t seconds = (remaining_ms + 999) / 1000;
    const int64_t upper = static_cast<int64_t>(config.max_retry_after_seconds());
    return static_cast<uint32_t>(std::clamp<int64_t>(seconds, 1, std::max<int64_t>(upper, 1)));
}

} // anonymous namespace

// ============================================================================
// Construction / Destruction
// ============================================================================

SlidingWindowRateLimiter::SlidingWindowRateLimiter()
    : SlidingWindowRateLimiter(Config{}) {}

SlidingWindowRateLimiter::SlidingWindowRateLimiter(const Config& config, Clock clock)
    : config_(config),
      clock_(clock ? std::move(clock) : Clock(&utils::epoch_ms)) {

    if (config_.sweep_interval_seconds > 0) {
        sweep_running_.store(true, std::memory_order_release);
        sweep_thread_ = std::thread([this]() { sweep_loop(); });
    }
}

SlidingWindowRateLimiter::~SlidingWindowRateLimiter() {
    {
        std::lock_guard<std::mutex> lock(sweep_mutex_);
        sweep_running_.store(false, std::memory_order_release);
    }
    sweep_cv_.notify_all();
    if (sweep_thread_.joinable()) {
        sweep_thread_.join();
    }
}

// ============================================================================
// Check
// ============================================================================

RateLimitResult SlidingWindowRateLimiter::check(
    const std::string& key, const RateLimitConfig& config) {
    return check(key, config, clock_());
}

RateLimitResult SlidingWindowRateLimiter::check(
    const std::string& key,
    const RateLimitConfig& config,
    TimestampMs now_ms) {

    total_checks_.fetch_add(1, std::memory_order_relaxed);

    while (true) {
        const auto entry = get_entry(key);
        std::lock_guard<std::mutex> lock(entry->mutex);

        // Swept between lookup and lock: fetch the replacement
        if (entry->retired) continue;

        entry->max_window_ms = std::max(entry->max_window_ms, config.window_ms);
        prune(entry->timestamps, now_ms, config.window_ms);

        if (entry->timestamps.size() < config.limit) {
            entry->timestamps.push_back(now_ms);
            return RateLimitResult::allow();
        }

        rejects_.fetch_add(1, std::memory_order_relaxed);
        const auto oldest = *std::min_element(
            entry->timestamps.begin(), entry->timestamps.end());
        return RateLimitResult::deny(retry_after_seconds(oldest, now_ms, config));
    }
}

std::shared_ptr<SlidingWindowRateLimiter::WindowEntry>
SlidingWindowRateLimiter::get_entry(const std::string& key) {
    // Fast path: shared lock for existing keys
    {
        std::shared_lock<std::shared_mutex> lock(entries_mutex_);
        const auto it = entries_.find(key);
        if (it != entries_.end()) {
            return it->second;
        }
    }

    // Slow path: unique lock, double-check
    std::unique_lock<std::shared_mutex> lock(entries_mutex_);
    auto [it, inserted] = entries_.try_emplace(key, nullptr);
    if (inserted) {
        it->second = std::make_shared<WindowEntry>();
    }
    return it->second;
}

size_t SlidingWindowRateLimiter::recorded(const std::string& key) const {
    std::shared_ptr<WindowEntry> entry;
    {
        std::shared_lock<std::shared_mutex> lock(entries_mutex_);
        const auto it = entries_.find(key);
        if (it == entries_.end()) return 0;
        entry = it->second;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->retired ? 0 : entry->timestamps.size();
}

// ============================================================================
// Reset / Sweep
// ============================================================================

void SlidingWindowRateLimiter::reset_all() {
    std::unique_lock<std::shared_mutex> lock(entries_mutex_);
    for (auto& [key, entry] : entries_) {
        std::lock_guard<std::mutex> entry_lock(entry->mutex);
        entry->retired = true;
    }
    entries_.clear();
}

size_t SlidingWindowRateLimiter::sweep(TimestampMs now_ms) {
    size_t removed = 0;
    {
        std::unique_lock<std::shared_mutex> lock(entries_mutex_);
        for (auto it = entries_.begin(); it != entries_.end(); ) {
            auto& entry = *it->second;
            std::lock_guard<std::mutex> entry_lock(entry.mutex);
            prune(entry.timestamps, now_ms, entry.max_window_ms);
            if (entry.timestamps.empty()) {
                entry.retired = true;
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }

    if (removed > 0) {
        keys_swept_.fetch_add(removed, std::memory_order_relaxed);
        utils::log::debug(std::format("Rate limiter sweep removed {} idle keys", removed));
    }
    return removed;
}

void SlidingWindowRateLimiter::sweep_loop() {
    while (sweep_running_.load(std::memory_order_acquire)) {
        {
            std::unique_lock<std::mutex> lock(sweep_mutex_);
            sweep_cv_.wait_for(lock,
                std::chrono::seconds(config_.sweep_interval_seconds),
                [this]() { return !sweep_running_.load(std::memory_order_acquire); });
        }

        if (!sweep_running_.load(std::memory_order_acquire)) break;

        (void)sweep(clock_());
    }
}

SlidingWindowRateLimiter::Stats SlidingWindowRateLimiter::get_stats() const {
    size_t keys = 0;
    {
        std::shared_lock<std::shared_mutex> lock(entries_mutex_);
        keys = entries_.size();
    }
    return Stats{
        .total_checks = total_checks_.load(std::memory_order_relaxed),
        .rejects = rejects_.load(std::memory_order_relaxed),
        .keys_swept = keys_swept_.load(std::memory_order_relaxed),
        .tracked_keys = keys,
    };
}

} // namespace gatekeeper
