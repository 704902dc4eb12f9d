#include <catch2/catch_test_macros.hpp>
#include "server/http_admission.hpp"
#include "server/rate_limiter.hpp"
#include "server/rate_limit_response.hpp"
#include "auth/identity_provider.hpp"

#include <httplib.h>

#include <stdexcept>

using namespace gatekeeper;

namespace {

httplib::Request make_request(const std::string& remote_addr,
                              const std::string& forwarded_for = "",
                              const std::string& authorization = "") {
    httplib::Request req;
    req.method = "POST";
    req.path = "/api/test";
    req.remote_addr = remote_addr;
    if (!forwarded_for.empty()) req.set_header("X-Forwarded-For", forwarded_for);
    if (!authorization.empty()) req.set_header("Authorization", authorization);
    return req;
}

std::shared_ptr<const IIdentityProvider> make_identity() {
    return std::make_shared<ApiKeyIdentityProvider>(std::vector<UserInfo>{
        {"u1", "alice", "key-alice", {"user"}},
        {"root", "ops", "key-admin", {"admin"}},
    });
}

struct Fixture {
    std::shared_ptr<SlidingWindowRateLimiter> limiter = std::make_shared<SlidingWindowRateLimiter>();
    std::shared_ptr<ConcurrencyGate> concurrency = std::make_shared<ConcurrencyGate>();
    std::shared_ptr<AdmissionGate> gate = std::make_shared<AdmissionGate>(limiter, concurrency);
    HttpAdmissionMiddleware middleware{gate, make_identity(), TrustedProxySet({"10.0.0.0/8"})};
};

} // anonymous namespace

TEST_CASE("resolve_client_ip: three-tier fallback", "[http_admission]") {
    SECTION("Resolved IP wins") {
        REQUIRE(resolve_client_ip({"1.2.3.4", "10.0.0.1"}) == "1.2.3.4");
    }
    SECTION("Falls back to the socket address") {
        REQUIRE(resolve_client_ip({std::nullopt, "10.0.0.1"}) == "10.0.0.1");
        REQUIRE(resolve_client_ip({"", "10.0.0.1"}) == "10.0.0.1");
    }
    SECTION("Falls back to unknown") {
        REQUIRE(resolve_client_ip({std::nullopt, std::nullopt}) == "unknown");
        REQUIRE(resolve_client_ip({"", ""}) == "unknown");
    }
}

TEST_CASE("client_address_from: trusted proxy handling", "[http_admission]") {
    const TrustedProxySet proxies({"10.0.0.0/8"});

    SECTION("Untrusted peer cannot spoof X-Forwarded-For") {
        const auto req = make_request("203.0.113.5", "1.2.3.4");
        const auto addr = client_address_from(req, proxies);
        REQUIRE(resolve_client_ip(addr) == "203.0.113.5");
    }

    SECTION("Trusted peer forwards the first hop") {
        const auto req = make_request("10.1.2.3", " 198.51.100.7 , 10.9.9.9");
        const auto addr = client_address_from(req, proxies);
        REQUIRE(addr.remote_address == "10.1.2.3");
        REQUIRE(resolve_client_ip(addr) == "198.51.100.7");
    }

    SECTION("Trusted peer without the header is the client") {
        const auto req = make_request("10.1.2.3");
        REQUIRE(resolve_client_ip(client_address_from(req, proxies)) == "10.1.2.3");
    }

    SECTION("IPv6-mapped peer is normalized") {
        const auto req = make_request("::ffff:10.1.2.3", "198.51.100.7");
        REQUIRE(resolve_client_ip(client_address_from(req, proxies)) == "198.51.100.7");
    }

    SECTION("No peer address at all") {
        const auto req = make_request("");
        REQUIRE(resolve_client_ip(client_address_from(req, proxies)) == "unknown");
    }

    SECTION("Empty trusted set trusts nobody") {
        const auto req = make_request("10.1.2.3", "198.51.100.7");
        REQUIRE(resolve_client_ip(client_address_from(req, TrustedProxySet{})) == "10.1.2.3");
    }
}

TEST_CASE("HttpAdmissionMiddleware: denies with the standard 429", "[http_admission]") {
    Fixture f;
    const auto policy = policies::standard(EndpointGroup::AUTH, LimitRegistry({{"auth_ip", 1, 60000}}));

    int calls = 0;
    const auto handler = f.middleware.wrap(policy, [&calls](const httplib::Request&, httplib::Response& res) {
        ++calls;
        res.status = 200;
        res.set_content("ok", "text/plain");
    });

    const auto req = make_request("203.0.113.5");

    httplib::Response first;
    handler(req, first);
    REQUIRE(calls == 1);
    REQUIRE(first.status == 200);

    httplib::Response second;
    handler(req, second);
    REQUIRE(calls == 1);
    REQUIRE(second.status == 429);
    REQUIRE(second.get_header_value("Retry-After") == "60");
    REQUIRE(second.body == rate_limit_json(60));

    SECTION("A different client IP is unaffected") {
        httplib::Response other;
        handler(make_request("203.0.113.6"), other);
        REQUIRE(calls == 2);
        REQUIRE(other.status == 200);
    }
}

TEST_CASE("HttpAdmissionMiddleware: slot held during the handler and released after", "[http_admission]") {
    Fixture f;
    const auto policy = policies::standard(EndpointGroup::KIT, LimitRegistry{});
    const auto req = make_request("203.0.113.5", "", "Bearer key-alice");

    SECTION("Normal return") {
        uint32_t active_inside = 0;
        const auto handler = f.middleware.wrap(policy, [&](const httplib::Request&, httplib::Response& res) {
            active_inside = f.concurrency->active("kit:concurrency:u1");
            res.status = 200;
        });

        httplib::Response res;
        handler(req, res);
        REQUIRE(active_inside == 1);
        REQUIRE(f.concurrency->active("kit:concurrency:u1") == 0);
    }

    SECTION("Handler throws") {
        const auto handler = f.middleware.wrap(policy, [](const httplib::Request&, httplib::Response&) {
            throw std::runtime_error("llm failed");
        });

        httplib::Response res;
        REQUIRE_THROWS_AS(handler(req, res), std::runtime_error);
        REQUIRE(f.concurrency->active("kit:concurrency:u1") == 0);

        // Next call is admitted
        const auto ok = f.middleware.wrap(policy, [](const httplib::Request&, httplib::Response& r) {
            r.status = 200;
        });
        httplib::Response res2;
        ok(req, res2);
        REQUIRE(res2.status == 200);
    }

    SECTION("Parallel call by the same user is denied with 30s") {
        httplib::Response nested;
        const auto inner = f.middleware.wrap(policy, [](const httplib::Request&, httplib::Response& r) {
            r.status = 200;
        });
        const auto outer = f.middleware.wrap(policy, [&](const httplib::Request& r, httplib::Response& res) {
            inner(r, nested);
            res.status = 200;
        });

        httplib::Response res;
        outer(req, res);
        REQUIRE(res.status == 200);
        REQUIRE(nested.status == 429);
        REQUIRE(nested.get_header_value("Retry-After") == "30");
    }
}

TEST_CASE("HttpAdmissionMiddleware: identity from the bearer token", "[http_admission]") {
    Fixture f;

    REQUIRE(f.middleware.identify(make_request("1.1.1.1", "", "Bearer key-alice")).user_id == "u1");
    REQUIRE(f.middleware.identify(make_request("1.1.1.1", "", "Bearer key-admin")).is_admin());
    REQUIRE_FALSE(f.middleware.identify(make_request("1.1.1.1", "", "Bearer wrong")).is_authenticated());
    REQUIRE_FALSE(f.middleware.identify(make_request("1.1.1.1")).is_authenticated());

    SECTION("Admin is never throttled") {
        const auto policy = policies::standard(EndpointGroup::AUTH, LimitRegistry({{"auth_ip", 1, 60000}}));
        const auto handler = f.middleware.wrap(policy, [](const httplib::Request&, httplib::Response& r) {
            r.status = 200;
        });
        const auto req = make_request("203.0.113.5", "", "Bearer key-admin");
        for (int i = 0; i < 5; ++i) {
            httplib::Response res;
            handler(req, res);
            REQUIRE(res.status == 200);
        }
    }
}
