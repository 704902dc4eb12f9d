#include <catch2/catch_test_macros.hpp>
#include "auth/identity_provider.hpp"
#include "core/error.hpp"

using namespace gatekeeper;

namespace {

std::vector<UserInfo> sample_users() {
    return {
        {"u1", "alice", "key-alice", {"user"}},
        {"u2", "bob", "key-bob", {}},
        {"root", "ops", "key-admin", {"user", "admin"}},
    };
}

} // anonymous namespace

TEST_CASE("ApiKeyIdentityProvider: resolves bearer keys", "[identity]") {
    const ApiKeyIdentityProvider provider(sample_users());
    REQUIRE(provider.user_count() == 3);
    REQUIRE(provider.name() == "api_key");

    SECTION("Regular user") {
        const auto caller = provider.identify("Bearer key-alice");
        REQUIRE(caller.is_authenticated());
        REQUIRE(caller.user_id == "u1");
        REQUIRE_FALSE(caller.is_admin());
    }

    SECTION("User without roles") {
        const auto caller = provider.identify("Bearer key-bob");
        REQUIRE(caller.user_id == "u2");
        REQUIRE(caller.role == Role::USER);
    }

    SECTION("Admin role") {
        const auto caller = provider.identify("Bearer key-admin");
        REQUIRE(caller.user_id == "root");
        REQUIRE(caller.is_admin());
    }
}

TEST_CASE("ApiKeyIdentityProvider: anything else is anonymous", "[identity]") {
    const ApiKeyIdentityProvider provider(sample_users());

    for (const std::string header : {"", "Bearer ", "Bearer unknown", "Basic key-alice",
                                     "bearer key-alice", "key-alice"}) {
        const auto caller = provider.identify(header);
        REQUIRE_FALSE(caller.is_authenticated());
        REQUIRE_FALSE(caller.is_admin());
    }
}

TEST_CASE("ApiKeyIdentityProvider: rejects bad user tables", "[identity]") {
    SECTION("Empty id") {
        REQUIRE_THROWS_AS(ApiKeyIdentityProvider({{"", "x", "k", {}}}), ConfigError);
    }
    SECTION("Empty key") {
        REQUIRE_THROWS_AS(ApiKeyIdentityProvider({{"u1", "x", "", {}}}), ConfigError);
    }
    SECTION("Shared key") {
        REQUIRE_THROWS_AS(ApiKeyIdentityProvider({{"u1", "a", "k", {}}, {"u2", "b", "k", {}}}),
                          ConfigError);
    }
}
