#include "server/limit_registry.hpp"

#include <algorithm>
#include <format>
#include <limits>
#include <unordered_set>

namespace gatekeeper {

std::vector<LimitEntry> LimitRegistry::standard_entries() {
    const auto entry = [](const char* name, const RateLimitConfig& cfg) {
        return LimitEntry{name, static_cast<int64_t>(cfg.limit), cfg.window_ms};
    };
    return {
        entry(limits::kEvidenceUser,  limits::kLlmUserLimit),
        entry(limits::kOutreachUser,  limits::kLlmUserLimit),
        entry(limits::kKitUser,       limits::kLlmUserLimit),
        entry(limits::kJdExtractUser, limits::kLlmUserLimit),
        entry(limits::kUrlFetchUser,  limits::kUrlFetchUserLimit),
        entry(limits::kUrlFetchIp,    limits::kUrlFetchIpLimit),
        entry(limits::kAuthIp,        limits::kAuthIpLimit),
    };
}

LimitRegistry::LimitRegistry()
    : LimitRegistry(std::vector<LimitEntry>{}) {}

LimitRegistry::LimitRegistry(const std::vector<LimitEntry>& overrides) {
    for (const auto& entry : standard_entries()) {
        add(entry, false);
    }

    std::unordered_set<std::string> seen;
    for (const auto& entry : overrides) {
        if (!entry.name.empty() && !seen.insert(entry.name).second) {
            throw ConfigError(std::format("duplicate limit name '{}'", entry.name));
        }
        add(entry, true);
    }
}

void LimitRegistry::add(const LimitEntry& entry, bool allow_replace) {
    if (entry.name.empty()) {
        throw ConfigError("limit name must not be empty");
    }
    if (entry.limit <= 0) {
        throw ConfigError(std::format(
            "limit '{}': limit must be > 0, got {}", entry.name, entry.limit));
    }
    if (entry.limit > std::numeric_limits<uint32_t>::max()) {
        throw ConfigError(std::format(
            "limit '{}': limit {} out of range", entry.name, entry.limit));
    }
    if (entry.window_ms <= 0) {
        throw ConfigError(std::format(
            "limit '{}': window_ms must be > 0, got {}", entry.name, entry.window_ms));
    }

    const RateLimitConfig cfg{static_cast<uint32_t>(entry.limit), entry.window_ms};
    if (allow_replace) {
        limits_.insert_or_assign(entry.name, cfg);
        return;
    }
    if (!limits_.emplace(entry.name, cfg).second) {
        throw ConfigError(std::format("duplicate limit name '{}'", entry.name));
    }
}

Result<RateLimitConfig> LimitRegistry::lookup(const std::string& name) const {
    const auto it = limits_.find(name);
    if (it == limits_.end()) {
        return Result<RateLimitConfig>::error(
            ErrorCategory::NOT_FOUND, std::format("unknown limit '{}'", name));
    }
    return Result<RateLimitConfig>::ok(it->second);
}

const RateLimitConfig& LimitRegistry::get(const std::string& name) const {
    const auto it = limits_.find(name);
    if (it == limits_.end()) {
        throw ConfigError(std::format("unknown limit '{}'", name));
    }
    return it->second;
}

bool LimitRegistry::contains(const std::string& name) const {
    return limits_.contains(name);
}

std::vector<std::string> LimitRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(limits_.size());
    for (const auto& [name, cfg] : limits_) {
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace gatekeeper
