#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace gatekeeper {

class ConcurrencyGate;

/**
 * @brief Scoped concurrency slot
 *
 * Move-only. Releases the slot on destruction, so every exit path of the
 * guarded call (return, exception) gives it back. A default-constructed
 * slot holds nothing.
 */
class ConcurrencySlot {
public:
    ConcurrencySlot() = default;
    ConcurrencySlot(ConcurrencyGate* gate, std::string key);
    ~ConcurrencySlot();

    ConcurrencySlot(ConcurrencySlot&& other) noexcept;
    ConcurrencySlot& operator=(ConcurrencySlot&& other) noexcept;

    ConcurrencySlot(const ConcurrencySlot&) = delete;
    ConcurrencySlot& operator=(const ConcurrencySlot&) = delete;

    [[nodiscard]] bool held() const { return gate_ != nullptr; }
    [[nodiscard]] const std::string& key() const { return key_; }

    /// Release early; idempotent
    void release();

private:
    ConcurrencyGate* gate_ = nullptr;
    std::string key_;
};

/**
 * @brief Per-key in-flight limiter
 *
 * key -> {active, max}. acquire() admits while active < max; release()
 * decrements and floors at zero. Entries are erased when they drain, so
 * an idle key costs nothing. One mutex guards the whole map: every
 * operation is a hash lookup and an increment.
 */
class ConcurrencyGate {
public:
    ConcurrencyGate() = default;

    ConcurrencyGate(const ConcurrencyGate&) = delete;
    ConcurrencyGate& operator=(const ConcurrencyGate&) = delete;

    /**
     * @brief Take one slot for key if fewer than max are active
     * @throws std::invalid_argument if max == 0
     *
     * A denied acquire has no side effect. If admitted, caller MUST call
     * release() when done (or use try_acquire_slot()).
     */
    [[nodiscard]] bool acquire(const std::string& key, uint32_t max);

    /**
     * @brief Give back one slot for key
     *
     * Releasing an idle key is harmless: the count stays at zero and the
     * over-release is counted and logged.
     */
    void release(const std::string& key);

    /**
     * @brief RAII form of acquire(); the returned slot is empty on denial
     */
    [[nodiscard]] ConcurrencySlot try_acquire_slot(const std::string& key, uint32_t max);

    [[nodiscard]] uint32_t active(const std::string& key) const;

    /**
     * @brief Drop every entry (test-only clear)
     */
    void reset_all();

    struct Stats {
        uint64_t acquired;
        uint64_t rejected;
        uint64_t over_releases;
        uint32_t total_active;
        size_t tracked_keys;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    struct Entry {
        uint32_t active = 0;
        uint32_t max = 0;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    uint32_t total_active_ = 0;
    uint64_t acquired_ = 0;
    uint64_t rejected_ = 0;
    uint64_t over_releases_ = 0;
};

} // namespace gatekeeper
