#include <catch2/catch_test_macros.hpp>
#include "server/limit_registry.hpp"
#include "server/admission_gate.hpp"

using namespace gatekeeper;

TEST_CASE("LimitRegistry: standard table", "[limit_registry]") {
    const LimitRegistry registry;

    REQUIRE(registry.size() == 7);
    REQUIRE(registry.get(limits::kEvidenceUser) == RateLimitConfig{10, 600000});
    REQUIRE(registry.get(limits::kOutreachUser) == RateLimitConfig{10, 600000});
    REQUIRE(registry.get(limits::kKitUser) == RateLimitConfig{10, 600000});
    REQUIRE(registry.get(limits::kJdExtractUser) == RateLimitConfig{10, 600000});
    REQUIRE(registry.get(limits::kUrlFetchUser) == RateLimitConfig{10, 3600000});
    REQUIRE(registry.get(limits::kUrlFetchIp) == RateLimitConfig{20, 3600000});
    REQUIRE(registry.get(limits::kAuthIp) == RateLimitConfig{20, 600000});
}

TEST_CASE("LimitRegistry: lookup reports unknown names", "[limit_registry]") {
    const LimitRegistry registry;

    const auto found = registry.lookup("auth_ip");
    REQUIRE(found.is_ok());
    REQUIRE(found.value().limit == 20);

    const auto missing = registry.lookup("nope");
    REQUIRE(missing.is_error());
    REQUIRE(missing.error_category() == ErrorCategory::NOT_FOUND);

    REQUIRE_FALSE(registry.contains("nope"));
    REQUIRE_THROWS_AS(registry.get("nope"), ConfigError);
}

TEST_CASE("LimitRegistry: overrides replace or add entries", "[limit_registry]") {
    const LimitRegistry registry({
        {"auth_ip", 5, 60000},
        {"waitlist_ip", 3, 3600000},
    });

    REQUIRE(registry.size() == 8);
    REQUIRE(registry.get("auth_ip") == RateLimitConfig{5, 60000});
    REQUIRE(registry.get("waitlist_ip") == RateLimitConfig{3, 3600000});
    REQUIRE(registry.get("evidence_user") == RateLimitConfig{10, 600000});
}

TEST_CASE("LimitRegistry: invalid entries fail at construction", "[limit_registry]") {
    SECTION("limit <= 0") {
        REQUIRE_THROWS_AS(LimitRegistry({{"x", 0, 1000}}), ConfigError);
        REQUIRE_THROWS_AS(LimitRegistry({{"x", -3, 1000}}), ConfigError);
    }

    SECTION("window_ms <= 0") {
        REQUIRE_THROWS_AS(LimitRegistry({{"x", 1, 0}}), ConfigError);
        REQUIRE_THROWS_AS(LimitRegistry({{"x", 1, -1}}), ConfigError);
    }

    SECTION("empty name") {
        REQUIRE_THROWS_AS(LimitRegistry({{"", 1, 1000}}), ConfigError);
    }

    SECTION("duplicate override name") {
        REQUIRE_THROWS_AS(LimitRegistry({{"x", 1, 1000}, {"x", 2, 1000}}), ConfigError);
    }

    SECTION("limit beyond 32 bits") {
        REQUIRE_THROWS_AS(LimitRegistry({{"x", 5'000'000'000, 1000}}), ConfigError);
    }
}

TEST_CASE("LimitRegistry: names are sorted", "[limit_registry]") {
    const LimitRegistry registry;
    const auto names = registry.names();
    REQUIRE(names.size() == 7);
    REQUIRE(names.front() == "auth_ip");
    REQUIRE(names.back() == "url_fetch_user");
}

TEST_CASE("Standard policies: per-group shape", "[limit_registry][policies]") {
    const LimitRegistry registry;

    SECTION("LLM-backed groups: per-user limit and one in flight") {
        for (const auto group : {EndpointGroup::EVIDENCE, EndpointGroup::OUTREACH,
                                 EndpointGroup::KIT, EndpointGroup::JD_EXTRACT}) {
            const auto p = policies::standard(group, registry);
            REQUIRE(p.prefix == endpoint_group_to_string(group));
            REQUIRE(p.user_limit == RateLimitConfig{10, 600000});
            REQUIRE_FALSE(p.ip_limit.has_value());
            REQUIRE(p.max_concurrent == 1);
        }
    }

    SECTION("url_fetch: user and IP limits, no concurrency gate") {
        const auto p = policies::standard(EndpointGroup::URL_FETCH, registry);
        REQUIRE(p.prefix == "urlfetch");
        REQUIRE(p.user_limit == RateLimitConfig{10, 3600000});
        REQUIRE(p.ip_limit == RateLimitConfig{20, 3600000});
        REQUIRE(p.max_concurrent == 0);
    }

    SECTION("auth: IP limit only") {
        const auto p = policies::standard(EndpointGroup::AUTH, registry);
        REQUIRE(p.prefix == "auth");
        REQUIRE_FALSE(p.user_limit.has_value());
        REQUIRE(p.ip_limit == RateLimitConfig{20, 600000});
        REQUIRE(p.max_concurrent == 0);
    }

    SECTION("waitlist has no standard policy") {
        REQUIRE_THROWS_AS(policies::standard(EndpointGroup::WAITLIST, registry), ConfigError);
    }

    SECTION("standard_all covers six groups") {
        REQUIRE(policies::standard_all(registry).size() == 6);
    }
}

TEST_CASE("Standard policies follow registry overrides", "[limit_registry][policies]") {
    const LimitRegistry registry({{"kit_user", 2, 1000}});
    const auto p = policies::standard(EndpointGroup::KIT, registry);
    REQUIRE(p.user_limit == RateLimitConfig{2, 1000});
}
