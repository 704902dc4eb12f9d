#include "server/http_server.hpp"
#include "server/http_constants.hpp"
#include "server/rate_limiter.hpp"
#include "server/upstream_forwarder.hpp"
#include "events/event_emitter.hpp"
#include "auth/identity_provider.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <chrono>
#include <format>
#include <stdexcept>
#include <thread>

namespace gatekeeper {

namespace {

// Route patterns are regexes in cpp-httplib; configured paths are literal
std::string escape_route_path(const std::string& path) {
    static constexpr std::string_view kSpecial = R"(.^$|()[]{}*+?\)";
    std::string out;
    out.reserve(path.size());
    for (const char c : path) {
        if (kSpecial.find(c) != std::string_view::npos) out += '\\';
        out += c;
    }
    return out;
}

} // anonymous namespace

HttpServer::HttpServer(const GatewayConfig& config, Dependencies deps,
                       std::vector<AdmissionPolicy> policies)
    : host_(config.server.host),
      port_(config.server.port),
      thread_pool_size_(config.server.thread_pool_size),
      tls_config_(config.server.tls),
      routes_(config.routes),
      procedures_(config.procedures),
      deps_(std::move(deps)),
      policies_(std::move(policies)),
      http_admission_(deps_.gate, deps_.identity, TrustedProxySet(config.server.trusted_proxies)),
      dispatcher_(deps_.gate) {
    if (!deps_.gate || !deps_.upstream) {
        throw std::invalid_argument("HttpServer requires an admission gate and an upstream");
    }
    register_procedures();
}

const AdmissionPolicy* HttpServer::find_policy(const std::string& group) const {
    const auto parsed = parse_endpoint_group(group);
    if (!parsed) {
        throw ConfigError(std::format("unknown endpoint group '{}'", group));
    }
    for (const auto& policy : policies_) {
        if (policy.group == *parsed) return &policy;
    }
    throw ConfigError(std::format("no admission policy for group '{}'", group));
}

void HttpServer::register_procedures() {
    for (const auto& proc : procedures_) {
        std::optional<AdmissionPolicy> policy;
        if (!proc.group.empty()) {
            policy = *find_policy(proc.group);
        }

        auto upstream = deps_.upstream;
        const std::string name = proc.name;
        dispatcher_.register_procedure(name, std::move(policy),
            [upstream, name](RpcCallContext& ctx, const std::string& input) {
                auto result = upstream->forward_rpc(name, input, ctx.authorization);
                if (!result.ok) {
                    throw RpcError(RpcErrorCode::BAD_GATEWAY, result.error);
                }
                if (result.status < 200 || result.status >= 300) {
                    throw RpcError(RpcErrorCode::BAD_GATEWAY,
                        std::format("Upstream returned HTTP {}", result.status));
                }
                return std::move(result.body);
            });
    }
}

// ============================================================================
// start() / stop()
// ============================================================================

void HttpServer::start() {
    std::unique_ptr<httplib::Server> svr_ptr;
    if (tls_config_.enabled) {
        svr_ptr = std::make_unique<httplib::SSLServer>(
            tls_config_.cert_file.c_str(), tls_config_.key_file.c_str());
        utils::log::info(std::format("TLS enabled: cert={}, key={}",
            tls_config_.cert_file, tls_config_.key_file));
    } else {
        svr_ptr = std::make_unique<httplib::Server>();
    }
    auto& svr = *svr_ptr;

    if (!svr.is_valid()) {
        throw std::runtime_error("Failed to initialize HTTP server (check TLS cert/key)");
    }

    const size_t pool_size = thread_pool_size_;
    svr.new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };

    register_routes(svr);

    {
        std::lock_guard<std::mutex> lock(server_mutex_);
        if (stop_requested_.load(std::memory_order_acquire)) return;
        running_server_ = &svr;
    }

    utils::log::info(std::format("Starting gatekeeper on {}:{} ({}, {} threads, {} routes, {} procedures)",
        host_, port_, tls_config_.enabled ? "HTTPS" : "HTTP", thread_pool_size_,
        routes_.size(), procedures_.size()));

    const bool listened = svr.listen(host_, port_);

    {
        std::lock_guard<std::mutex> lock(server_mutex_);
        running_server_ = nullptr;
    }

    if (!listened && !stop_requested_.load(std::memory_order_acquire)) {
        throw std::runtime_error(std::format("Failed to listen on {}:{}", host_, port_));
    }
}

void HttpServer::stop() {
    stop_requested_.store(true, std::memory_order_release);

    // httplib ignores stop() until listen() is accepting; start() clears
    // running_server_ once listen() returns, so this loop always ends
    while (true) {
        {
            std::lock_guard<std::mutex> lock(server_mutex_);
            if (running_server_ == nullptr) break;
            if (running_server_->is_running()) {
                running_server_->stop();
                break;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    utils::log::info("Server stopped");
}

// ============================================================================
// Route registration
// ============================================================================

void HttpServer::register_routes(httplib::Server& svr) {
    svr.Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
    svr.Get("/metrics", [this](const httplib::Request& req, httplib::Response& res) {
        handle_metrics(req, res);
    });
    svr.Post(std::format("{}([A-Za-z0-9_.\\-]+)", http::kRpcPathPrefix),
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_rpc(req, res);
        });

    auto upstream = deps_.upstream;
    const httplib::Server::Handler forward = [upstream](const httplib::Request& req, httplib::Response& res) {
        upstream->forward(req, res);
    };

    for (const auto& route : routes_) {
        const auto handler = route.group.empty()
            ? forward
            : http_admission_.wrap(*find_policy(route.group), forward);
        const auto pattern = escape_route_path(route.path);
        svr.Get(pattern, handler);
        svr.Post(pattern, handler);
        svr.Put(pattern, handler);
        svr.Patch(pattern, handler);
        svr.Delete(pattern, handler);
        utils::log::debug(std::format("Route {} -> group '{}'", route.path,
            route.group.empty() ? "-" : route.group));
    }
}

// ============================================================================
// Handlers
// ============================================================================

void HttpServer::handle_health(const httplib::Request&, httplib::Response& res) {
    res.set_content(std::format(R"({{"status":"healthy","bypass":{}}})",
                                utils::booltostr(deps_.gate->bypass_enabled())),
                    http::kJsonContentType);
}

void HttpServer::handle_metrics(const httplib::Request&, httplib::Response& res) {
    res.set_content(build_metrics_output(), http::kPrometheusContentType);
}

void HttpServer::handle_rpc(const httplib::Request& req, httplib::Response& res) {
    RpcCallContext ctx;
    ctx.caller = http_admission_.identify(req);
    ctx.ip = http_admission_.client_ip(req);
    ctx.authorization = req.get_header_value(http::kAuthorizationHeader);

    const std::string procedure = req.matches[1];
    const auto response = dispatcher_.call(procedure, std::move(ctx), req.body);

    res.status = response.status;
    for (const auto& [name, value] : response.headers) {
        res.set_header(name, value);
    }
    res.set_content(response.body, http::kJsonContentType);
}

std::string HttpServer::build_metrics_output() const {
    std::string output;

    const auto gate_stats = deps_.gate->get_stats();
    output += std::format(
        "# HELP gatekeeper_admissions_total Admission decisions by outcome\n"
        "# TYPE gatekeeper_admissions_total counter\n"
        "gatekeeper_admissions_total{{outcome=\"admitted\"}} {}\n"
        "gatekeeper_admissions_total{{outcome=\"bypassed\"}} {}\n"
        "gatekeeper_admissions_total{{outcome=\"ip_rate\"}} {}\n"
        "gatekeeper_admissions_total{{outcome=\"user_rate\"}} {}\n"
        "gatekeeper_admissions_total{{outcome=\"concurrency\"}} {}\n\n",
        gate_stats.admitted, gate_stats.bypassed, gate_stats.ip_denials,
        gate_stats.user_denials, gate_stats.concurrency_denials);

    if (const auto* limiter = dynamic_cast<const SlidingWindowRateLimiter*>(deps_.gate->limiter().get())) {
        const auto rl = limiter->get_stats();
        output += std::format(
            "# HELP gatekeeper_rate_limit_checks_total Total rate limit checks performed\n"
            "# TYPE gatekeeper_rate_limit_checks_total counter\n"
            "gatekeeper_rate_limit_checks_total {}\n\n"
            "# HELP gatekeeper_rate_limit_rejects_total Rate limit checks that denied\n"
            "# TYPE gatekeeper_rate_limit_rejects_total counter\n"
            "gatekeeper_rate_limit_rejects_total {}\n\n"
            "# HELP gatekeeper_rate_limit_keys Keys currently tracked\n"
            "# TYPE gatekeeper_rate_limit_keys gauge\n"
            "gatekeeper_rate_limit_keys {}\n\n"
            "# HELP gatekeeper_rate_limit_swept_total Idle keys removed by the sweep\n"
            "# TYPE gatekeeper_rate_limit_swept_total counter\n"
            "gatekeeper_rate_limit_swept_total {}\n\n",
            rl.total_checks, rl.rejects, rl.tracked_keys, rl.keys_swept);
    }

    const auto cs = deps_.gate->concurrency()->get_stats();
    output += std::format(
        "# HELP gatekeeper_concurrency_active Slots currently held\n"
        "# TYPE gatekeeper_concurrency_active gauge\n"
        "gatekeeper_concurrency_active {}\n\n"
        "# HELP gatekeeper_concurrency_rejects_total Acquire attempts denied\n"
        "# TYPE gatekeeper_concurrency_rejects_total counter\n"
        "gatekeeper_concurrency_rejects_total {}\n\n"
        "# HELP gatekeeper_concurrency_over_releases_total Releases without a held slot\n"
        "# TYPE gatekeeper_concurrency_over_releases_total counter\n"
        "gatekeeper_concurrency_over_releases_total {}\n\n",
        cs.total_active, cs.rejected, cs.over_releases);

    if (deps_.events) {
        const auto es = deps_.events->get_stats();
        output += std::format(
            "# HELP gatekeeper_events_total Operational events by outcome\n"
            "# TYPE gatekeeper_events_total counter\n"
            "gatekeeper_events_total{{outcome=\"written\"}} {}\n"
            "gatekeeper_events_total{{outcome=\"dropped\"}} {}\n"
            "gatekeeper_events_total{{outcome=\"sink_failure\"}} {}\n\n",
            es.total_written, es.dropped, es.sink_write_failures);
    }

    const auto us = deps_.upstream->get_stats();
    output += std::format(
        "# HELP gatekeeper_upstream_requests_total Calls forwarded to the backend\n"
        "# TYPE gatekeeper_upstream_requests_total counter\n"
        "gatekeeper_upstream_requests_total{{result=\"ok\"}} {}\n"
        "gatekeeper_upstream_requests_total{{result=\"error\"}} {}\n",
        us.forwarded, us.upstream_errors);

    return output;
}

} // namespace gatekeeper
