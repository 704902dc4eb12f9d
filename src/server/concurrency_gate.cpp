#include "server/concurrency_gate.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>
#include <utility>

namespace gatekeeper {

// ============================================================================
// ConcurrencySlot
// ============================================================================

ConcurrencySlot::ConcurrencySlot(ConcurrencyGate* gate, std::string key)
    : gate_(gate), key_(std::move(key)) {}

ConcurrencySlot::~ConcurrencySlot() {
    release();
}

ConcurrencySlot::ConcurrencySlot(ConcurrencySlot&& other) noexcept
    : gate_(std::exchange(other.gate_, nullptr)),
      key_(std::move(other.key_)) {}

ConcurrencySlot& ConcurrencySlot::operator=(ConcurrencySlot&& other) noexcept {
    if (this != &other) {
        release();
        gate_ = std::exchange(other.gate_, nullptr);
        key_ = std::move(other.key_);
    }
    return *this;
}

void ConcurrencySlot::release() {
    if (gate_ != nullptr) {
        std::exchange(gate_, nullptr)->release(key_);
    }
}

// ============================================================================
// ConcurrencyGate
// ============================================================================

bool ConcurrencyGate::acquire(const std::string& key, uint32_t max) {
    if (max == 0) {
        throw std::invalid_argument(std::format(
            "ConcurrencyGate::acquire: max must be >= 1 (key '{}')", key));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = entries_[key];
    entry.max = max;
    if (entry.active >= max) {
        if (entry.active == 0) entries_.erase(key);
        ++rejected_;
        return false;
    }

    ++entry.active;
    ++total_active_;
    ++acquired_;
    return true;
}

void ConcurrencyGate::release(const std::string& key) {
    bool over_release = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = entries_.find(key);
        if (it == entries_.end() || it->second.active == 0) {
            ++over_releases_;
            over_release = true;
        } else {
            --total_active_;
            if (--it->second.active == 0) {
                entries_.erase(it);
            }
        }
    }

    if (over_release) {
        utils::log::warn(std::format("Concurrency release without active slot: {}", key));
    }
}

ConcurrencySlot ConcurrencyGate::try_acquire_slot(const std::string& key, uint32_t max) {
    if (!acquire(key, max)) {
        return {};
    }
    return ConcurrencySlot(this, key);
}

uint32_t ConcurrencyGate::active(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(key);
    return it == entries_.end() ? 0 : it->second.active;
}

void ConcurrencyGate::reset_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    total_active_ = 0;
}

ConcurrencyGate::Stats ConcurrencyGate::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {
        .acquired = acquired_,
        .rejected = rejected_,
        .over_releases = over_releases_,
        .total_active = total_active_,
        .tracked_keys = entries_.size(),
    };
}

} // namespace gatekeeper
