#include "auth/identity_provider.hpp"
#include "server/http_constants.hpp"
#include "core/error.hpp"

#include <format>

namespace gatekeeper {

ApiKeyIdentityProvider::ApiKeyIdentityProvider(const std::vector<UserInfo>& users) {
    for (const auto& user : users) {
        if (user.id.empty()) {
            throw ConfigError(std::format("user '{}' has an empty id", user.name));
        }
        if (user.api_key.empty()) {
            throw ConfigError(std::format("user '{}' has an empty api_key", user.id));
        }
        const Role role = user.has_role("admin") ? Role::ADMIN : Role::USER;
        if (!by_key_.emplace(user.api_key, CallerIdentity::user(user.id, role)).second) {
            throw ConfigError(std::format("user '{}' reuses another user's api_key", user.id));
        }
    }
}

CallerIdentity ApiKeyIdentityProvider::identify(const std::string& auth_header) const {
    const std::string_view header = auth_header;
    if (header.size() <= http::kBearerPrefix.size() ||
        header.substr(0, http::kBearerPrefix.size()) != http::kBearerPrefix) {
        return CallerIdentity::anonymous();
    }

    const std::string key(header.substr(http::kBearerPrefix.size()));
    const auto it = by_key_.find(key);
    if (it == by_key_.end()) {
        return CallerIdentity::anonymous();
    }
    return it->second;
}

} // namespace gatekeeper
