#pragma once

#include "config/config_types.hpp"
#include "server/admission_gate.hpp"
#include "server/http_admission.hpp"
#include "server/rpc_dispatcher.hpp"

#include <httplib.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace gatekeeper {

class EventEmitter;
class IIdentityProvider;
class UpstreamForwarder;

/**
 * @brief Admission gateway HTTP server
 *
 * Routes:
 * - GET  /health            liveness
 * - GET  /metrics           Prometheus text
 * - configured [[routes]]   HttpAdmissionMiddleware -> UpstreamForwarder
 * - POST /rpc/<procedure>   RpcDispatcher -> UpstreamForwarder
 */
class HttpServer {
public:
    struct Dependencies {
        std::shared_ptr<AdmissionGate> gate;
        std::shared_ptr<const IIdentityProvider> identity;
        std::shared_ptr<UpstreamForwarder> upstream;
        std::shared_ptr<EventEmitter> events;       // optional, metrics only
    };

    /**
     * @throws ConfigError if a route or procedure names a group with no policy
     */
    HttpServer(const GatewayConfig& config, Dependencies deps,
               std::vector<AdmissionPolicy> policies);

    /**
     * @brief Create the listener, register routes and block serving
     * @throws std::runtime_error if the listener cannot bind
     */
    void start();

    /**
     * @brief Stop a running start(), or make a later start() return at once
     *
     * Thread-safe, but takes locks: call it from a signal-watching
     * thread, never from an async signal handler.
     */
    void stop();

    /**
     * @brief Register every route on svr (used by start(), exposed for tests)
     */
    void register_routes(httplib::Server& svr);

    [[nodiscard]] std::string build_metrics_output() const;

    [[nodiscard]] const RpcDispatcher& dispatcher() const { return dispatcher_; }

private:
    [[nodiscard]] const AdmissionPolicy* find_policy(const std::string& group) const;
    void register_procedures();

    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_metrics(const httplib::Request& req, httplib::Response& res);
    void handle_rpc(const httplib::Request& req, httplib::Response& res);

    std::string host_;
    int port_;
    size_t thread_pool_size_;
    TlsConfig tls_config_;
    std::vector<RouteConfig> routes_;
    std::vector<ProcedureConfig> procedures_;

    Dependencies deps_;
    std::vector<AdmissionPolicy> policies_;
    HttpAdmissionMiddleware http_admission_;
    RpcDispatcher dispatcher_;

    std::mutex server_mutex_;
    httplib::Server* running_server_ = nullptr;
    std::atomic<bool> stop_requested_{false};
};

} // namespace gatekeeper
