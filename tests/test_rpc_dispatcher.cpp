#include <catch2/catch_test_macros.hpp>
#include "server/rpc_dispatcher.hpp"
#include "server/rate_limiter.hpp"
#include "server/rate_limit_response.hpp"

#include <stdexcept>

using namespace gatekeeper;

namespace {

struct Fixture {
    std::shared_ptr<SlidingWindowRateLimiter> limiter = std::make_shared<SlidingWindowRateLimiter>();
    std::shared_ptr<ConcurrencyGate> concurrency = std::make_shared<ConcurrencyGate>();
    std::shared_ptr<AdmissionGate> gate = std::make_shared<AdmissionGate>(limiter, concurrency);
};

RpcCallContext user_ctx(const std::string& id) {
    RpcCallContext ctx;
    ctx.caller = CallerIdentity::user(id);
    ctx.ip = "198.51.100.1";
    return ctx;
}

const std::string* find_header(const RpcResponse& res, const std::string& name) {
    for (const auto& [key, value] : res.headers) {
        if (key == name) return &value;
    }
    return nullptr;
}

} // anonymous namespace

TEST_CASE("RpcAdmissionMiddleware: denial throws TOO_MANY_REQUESTS", "[rpc]") {
    Fixture f;
    const auto policy = policies::standard(EndpointGroup::EVIDENCE, LimitRegistry({{"evidence_user", 1, 600000}}));
    RpcAdmissionMiddleware middleware(f.gate, policy);

    int calls = 0;
    const RpcProcedure proc = [&calls](RpcCallContext&, const std::string& input) {
        ++calls;
        return input;
    };

    auto ctx = user_ctx("u1");
    std::vector<std::pair<std::string, std::string>> headers;
    ctx.set_header = [&headers](const std::string& name, const std::string& value) {
        headers.emplace_back(name, value);
    };

    REQUIRE(middleware.invoke(ctx, "{}", proc) == "{}");
    REQUIRE(calls == 1);

    try {
        (void)middleware.invoke(ctx, "{}", proc);
        FAIL("expected RpcError");
    } catch (const RpcError& e) {
        REQUIRE(e.code() == RpcErrorCode::TOO_MANY_REQUESTS);
        REQUIRE(e.retry_after_seconds() == 600u);
        REQUIRE(std::string(e.what()) == rate_limit_message(600));
    }
    REQUIRE(calls == 1);
    REQUIRE(headers.size() == 1);
    REQUIRE(headers[0].first == "Retry-After");
    REQUIRE(headers[0].second == "600");
}

TEST_CASE("RpcAdmissionMiddleware: works without a header channel", "[rpc]") {
    Fixture f;
    const auto policy = policies::standard(EndpointGroup::JD_EXTRACT, LimitRegistry({{"jd_extract_user", 1, 1000}}));
    RpcAdmissionMiddleware middleware(f.gate, policy);
    const RpcProcedure proc = [](RpcCallContext&, const std::string&) { return std::string("ok"); };

    auto ctx = user_ctx("u1");
    REQUIRE(middleware.invoke(ctx, "", proc) == "ok");
    REQUIRE_THROWS_AS(middleware.invoke(ctx, "", proc), RpcError);
}

TEST_CASE("RpcAdmissionMiddleware: slot released when the procedure throws", "[rpc]") {
    Fixture f;
    const auto policy = policies::standard(EndpointGroup::OUTREACH, LimitRegistry{});
    RpcAdmissionMiddleware middleware(f.gate, policy);

    auto ctx = user_ctx("u1");
    const RpcProcedure failing = [&f](RpcCallContext&, const std::string&) -> std::string {
        REQUIRE(f.concurrency->active("outreach:concurrency:u1") == 1);
        throw std::runtime_error("model timeout");
    };

    REQUIRE_THROWS_AS(middleware.invoke(ctx, "", failing), std::runtime_error);
    REQUIRE(f.concurrency->active("outreach:concurrency:u1") == 0);
}

TEST_CASE("RpcDispatcher: structured responses", "[rpc]") {
    Fixture f;
    RpcDispatcher dispatcher(f.gate);

    dispatcher.register_procedure("kit.generate",
        policies::standard(EndpointGroup::KIT, LimitRegistry({{"kit_user", 1, 600000}})),
        [](RpcCallContext&, const std::string&) { return std::string(R"({"kit":1})"); });
    dispatcher.register_procedure("profile.get", std::nullopt,
        [](RpcCallContext& ctx, const std::string&) {
            return std::string(R"({"user":")") + ctx.caller.user_id.value_or("") + "\"}";
        });
    dispatcher.register_procedure("broken", std::nullopt,
        [](RpcCallContext&, const std::string&) -> std::string {
            throw std::logic_error("boom");
        });
    dispatcher.register_procedure("upstream.down", std::nullopt,
        [](RpcCallContext&, const std::string&) -> std::string {
            throw RpcError(RpcErrorCode::BAD_GATEWAY, "connection \"refused\"");
        });

    SECTION("Allowed call returns the procedure output") {
        const auto res = dispatcher.call("kit.generate", user_ctx("u1"), "{}");
        REQUIRE(res.status == 200);
        REQUIRE(res.body == R"({"kit":1})");
        REQUIRE(res.headers.empty());
    }

    SECTION("Denied call becomes a 429 with the standard body") {
        (void)dispatcher.call("kit.generate", user_ctx("u1"), "{}");
        const auto res = dispatcher.call("kit.generate", user_ctx("u1"), "{}");
        REQUIRE(res.status == 429);
        REQUIRE(res.body == rate_limit_json(600));
        const auto* retry = find_header(res, "Retry-After");
        REQUIRE(retry != nullptr);
        REQUIRE(*retry == "600");
        size_t retry_headers = 0;
        for (const auto& h : res.headers) {
            if (h.first == "Retry-After") ++retry_headers;
        }
        REQUIRE(retry_headers == 1);
    }

    SECTION("Unthrottled procedure") {
        for (int i = 0; i < 20; ++i) {
            REQUIRE(dispatcher.call("profile.get", user_ctx("u9"), "").status == 200);
        }
        REQUIRE(dispatcher.call("profile.get", user_ctx("u9"), "").body == R"({"user":"u9"})");
    }

    SECTION("Unknown procedure is 404") {
        const auto res = dispatcher.call("nope", user_ctx("u1"), "");
        REQUIRE(res.status == 404);
        REQUIRE(res.body.find("NOT_FOUND") != std::string::npos);
    }

    SECTION("Unexpected exception is 500 without leaking the message") {
        const auto res = dispatcher.call("broken", user_ctx("u1"), "");
        REQUIRE(res.status == 500);
        REQUIRE(res.body.find("INTERNAL") != std::string::npos);
        REQUIRE(res.body.find("boom") == std::string::npos);
    }

    SECTION("BAD_GATEWAY is 502 with an escaped message") {
        const auto res = dispatcher.call("upstream.down", user_ctx("u1"), "");
        REQUIRE(res.status == 502);
        REQUIRE(res.body == R"({"error":"BAD_GATEWAY","message":"connection \"refused\""})");
    }

    SECTION("Registry queries") {
        REQUIRE(dispatcher.has_procedure("kit.generate"));
        REQUIRE_FALSE(dispatcher.has_procedure("nope"));
        REQUIRE(dispatcher.procedure_names() ==
                std::vector<std::string>{"broken", "kit.generate", "profile.get", "upstream.down"});
    }
}

TEST_CASE("RpcDispatcher: re-registration replaces the procedure", "[rpc]") {
    Fixture f;
    RpcDispatcher dispatcher(f.gate);
    dispatcher.register_procedure("p", std::nullopt,
        [](RpcCallContext&, const std::string&) { return std::string("v1"); });
    dispatcher.register_procedure("p", std::nullopt,
        [](RpcCallContext&, const std::string&) { return std::string("v2"); });

    REQUIRE(dispatcher.call("p", RpcCallContext{}, "").body == "v2");
    REQUIRE(dispatcher.procedure_names().size() == 1);
}
