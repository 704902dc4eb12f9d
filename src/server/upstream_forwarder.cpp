#include "server/upstream_forwarder.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

#include <chrono>
#include <format>

namespace gatekeeper {

namespace {

// Hop-by-hop, recomputed by cpp-httplib, or injected by its server
bool skip_header(const std::string& name) {
    const std::string lower = utils::to_lower(name);
    return lower == "host" || lower == "content-length" || lower == "connection" ||
           lower == "transfer-encoding" || lower == "keep-alive" ||
           lower == "remote_addr" || lower == "remote_port" ||
           lower == "local_addr" || lower == "local_port";
}

} // anonymous namespace

UpstreamForwarder::UpstreamForwarder(const Config& config)
    : config_(config) {}

std::string UpstreamForwarder::base_url() const {
    return std::format("http://{}:{}", config_.host, config_.port);
}

httplib::Client UpstreamForwarder::make_client() const {
    httplib::Client cli(config_.host, config_.port);
    cli.set_connection_timeout(std::chrono::milliseconds(config_.timeout_ms));
    cli.set_read_timeout(std::chrono::milliseconds(config_.timeout_ms));
    cli.set_write_timeout(std::chrono::milliseconds(config_.timeout_ms));
    return cli;
}

void UpstreamForwarder::forward(const httplib::Request& req, httplib::Response& res) {
    auto cli = make_client();

    httplib::Request upstream;
    upstream.method = req.method;
    upstream.path = httplib::append_query_params(req.path, req.params);
    for (const auto& [name, value] : req.headers) {
        if (!skip_header(name)) {
            upstream.headers.emplace(name, value);
        }
    }
    upstream.body = req.body;

    const auto result = cli.send(upstream);
    if (!result) {
        upstream_errors_.fetch_add(1, std::memory_order_relaxed);
        const std::string reason = httplib::to_string(result.error());
        utils::log::error(std::format("Upstream {} {} failed: {}", req.method, req.path, reason));
        res.status = httplib::StatusCode::BadGateway_502;
        res.set_content(std::format(R"({{"error":"BAD_GATEWAY","message":"Upstream unavailable: {}"}})",
                                    utils::escape_json(reason)),
                        http::kJsonContentType);
        return;
    }

    forwarded_.fetch_add(1, std::memory_order_relaxed);
    res.status = result->status;
    for (const auto& [name, value] : result->headers) {
        if (!skip_header(name) && utils::to_lower(name) != "content-type") {
            res.set_header(name, value);
        }
    }
    res.set_content(result->body, result->get_header_value("Content-Type"));
}

UpstreamForwarder::Result UpstreamForwarder::forward_rpc(const std::string& procedure,
                                                         const std::string& body,
                                                         const std::string& auth_header) {
    auto cli = make_client();

    httplib::Headers headers;
    if (!auth_header.empty()) {
        headers.emplace(http::kAuthorizationHeader, auth_header);
    }

    const auto path = std::format("{}{}", http::kRpcPathPrefix, procedure);
    const auto res = cli.Post(path, headers, body, http::kJsonContentType);

    Result result;
    if (!res) {
        upstream_errors_.fetch_add(1, std::memory_order_relaxed);
        result.error = std::format("Upstream unavailable: {}", httplib::to_string(res.error()));
        utils::log::error(std::format("Upstream RPC {} failed: {}", procedure, result.error));
        return result;
    }

    forwarded_.fetch_add(1, std::memory_order_relaxed);
    result.ok = true;
    result.status = res->status;
    result.body = res->body;
    result.content_type = res->get_header_value("Content-Type");
    return result;
}

UpstreamForwarder::Stats UpstreamForwarder::get_stats() const {
    return {
        .forwarded = forwarded_.load(std::memory_order_relaxed),
        .upstream_errors = upstream_errors_.load(std::memory_order_relaxed),
    };
}

} // namespace gatekeeper
