#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace gatekeeper {

/**
 * @brief Source of the caller's identity and role
 *
 * The gateway never authenticates on its own; it asks the provider and
 * treats anything unrecognized as anonymous.
 */
class IIdentityProvider {
public:
    virtual ~IIdentityProvider() = default;

    /**
     * @brief Resolve a caller from the Authorization header value
     * @param auth_header Raw header (may be empty)
     */
    [[nodiscard]] virtual CallerIdentity identify(const std::string& auth_header) const = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

/**
 * @brief Configured user entry
 */
struct UserInfo {
    std::string id;
    std::string name;
    std::string api_key;                // Bearer token
    std::vector<std::string> roles;

    [[nodiscard]] bool has_role(std::string_view role) const {
        for (const auto& r : roles) {
            if (r == role) return true;
        }
        return false;
    }
};

/**
 * @brief Static API-key table: "Authorization: Bearer <key>" -> user
 *
 * Role is ADMIN iff the user carries the "admin" role. An absent,
 * malformed or unknown key yields an anonymous caller.
 */
class ApiKeyIdentityProvider : public IIdentityProvider {
public:
    /// @throws ConfigError on an empty id, empty key or duplicate key
    explicit ApiKeyIdentityProvider(const std::vector<UserInfo>& users);

    [[nodiscard]] CallerIdentity identify(const std::string& auth_header) const override;
    [[nodiscard]] std::string name() const override { return "api_key"; }

    [[nodiscard]] size_t user_count() const { return by_key_.size(); }

private:
    std::unordered_map<std::string, CallerIdentity> by_key_;
};

} // namespace gatekeeper
