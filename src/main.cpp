#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "server/http_server.hpp"
#include "server/rate_limiter.hpp"
#include "server/concurrency_gate.hpp"
#include "server/admission_gate.hpp"
#include "server/limit_registry.hpp"
#include "server/upstream_forwarder.hpp"
#include "auth/identity_provider.hpp"
#include "events/event_emitter.hpp"
#include "events/log_sink.hpp"
#include "events/file_sink.hpp"

#include <atomic>
#include <memory>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <format>
#include <functional>
#include <pthread.h>
#include <stdexcept>
#include <thread>

using namespace gatekeeper;

namespace {

/**
 * @brief Delivers SIGINT/SIGTERM to a dedicated thread via sigwait
 *
 * block() must run before any other thread exists so every thread
 * inherits the mask. The watcher then calls on_signal from ordinary
 * thread context, where taking locks and logging are allowed.
 */
class ShutdownSignalWatcher {
public:
    static sigset_t block() {
        sigset_t signals;
        sigemptyset(&signals);
        sigaddset(&signals, SIGINT);
        sigaddset(&signals, SIGTERM);
        if (const int rc = pthread_sigmask(SIG_BLOCK, &signals, nullptr); rc != 0) {
            throw std::runtime_error(std::format("pthread_sigmask failed: {}", std::strerror(rc)));
        }
        return signals;
    }

    ShutdownSignalWatcher(sigset_t signals, std::function<void()> on_signal)
        : signals_(signals), on_signal_(std::move(on_signal)),
          thread_(&ShutdownSignalWatcher::run, this) {}

    ~ShutdownSignalWatcher() {
        // Wake sigwait when the server stopped for another reason
        done_.store(true, std::memory_order_release);
        if (thread_.joinable()) {
            pthread_kill(thread_.native_handle(), SIGTERM);
            thread_.join();
        }
    }

    ShutdownSignalWatcher(const ShutdownSignalWatcher&) = delete;
    ShutdownSignalWatcher& operator=(const ShutdownSignalWatcher&) = delete;

private:
    void run() {
        int signal = 0;
        if (const int rc = sigwait(&signals_, &signal); rc != 0) {
            utils::log::error(std::format("sigwait failed: {}", std::strerror(rc)));
            return;
        }
        if (done_.load(std::memory_order_acquire)) return;
        utils::log::info(std::format("Received signal {}, shutting down...", signal));
        on_signal_();
    }

    sigset_t signals_;
    std::function<void()> on_signal_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        utils::log::info("Gatekeeper starting...");

        const sigset_t shutdown_signals = ShutdownSignalWatcher::block();

        std::string config_file = "config/gatekeeper.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/5] Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.ok()) {
            utils::log::error(config_result.error());
            return 1;
        }
        const auto& cfg = config_result.config;
        utils::log::set_level(utils::log::parse_level(cfg.logging.level));
        utils::log::info(std::format("Config loaded: {} users, {} routes, {} procedures",
            cfg.users.size(), cfg.routes.size(), cfg.procedures.size()));

        // Limits and policies
        utils::log::info("[2/5] Resolving admission policies...");
        const LimitRegistry registry(cfg.admission.limits);
        auto policies = ConfigLoader::build_policies(cfg.admission, registry);
        for (const auto& policy : policies) {
            utils::log::debug(std::format("Policy {}: prefix={}, user_limit={}, ip_limit={}, max_concurrent={}",
                endpoint_group_to_string(policy.group), policy.prefix,
                policy.user_limit ? std::format("{}/{}ms", policy.user_limit->limit, policy.user_limit->window_ms) : "-",
                policy.ip_limit ? std::format("{}/{}ms", policy.ip_limit->limit, policy.ip_limit->window_ms) : "-",
                policy.max_concurrent));
        }

        // Event sinks
        utils::log::info("[3/5] Event emitter initializing...");
        std::vector<std::unique_ptr<IEventSink>> sinks;
        if (cfg.events.log_sink) {
            sinks.push_back(std::make_unique<LogEventSink>());
        }
        if (!cfg.events.file.empty()) {
            sinks.push_back(std::make_unique<FileEventSink>(cfg.events.file));
        }
        EventEmitter::Config emitter_cfg;
        emitter_cfg.queue_capacity = cfg.events.queue_capacity;
        auto events = std::make_shared<EventEmitter>(emitter_cfg, std::move(sinks));

        // Admission
        utils::log::info("[4/5] Admission gate initializing...");
        SlidingWindowRateLimiter::Config limiter_cfg;
        limiter_cfg.sweep_interval_seconds = cfg.admission.sweep_interval_seconds;
        auto limiter = std::make_shared<SlidingWindowRateLimiter>(limiter_cfg);
        auto concurrency = std::make_shared<ConcurrencyGate>();

        AdmissionGate::Options gate_options;
        gate_options.bypass = cfg.admission.bypass;
        auto gate = std::make_shared<AdmissionGate>(limiter, concurrency, events, gate_options);

        auto identity = std::make_shared<ApiKeyIdentityProvider>(cfg.users);

        UpstreamForwarder::Config upstream_cfg;
        upstream_cfg.host = cfg.upstream.host;
        upstream_cfg.port = cfg.upstream.port;
        upstream_cfg.timeout_ms = cfg.upstream.timeout_ms;
        auto upstream = std::make_shared<UpstreamForwarder>(upstream_cfg);
        utils::log::info(std::format("Upstream: {}", upstream->base_url()));

        // Server
        utils::log::info("[5/5] HTTP server initializing...");
        HttpServer::Dependencies deps;
        deps.gate = gate;
        deps.identity = identity;
        deps.upstream = upstream;
        deps.events = events;
        auto server = std::make_shared<HttpServer>(cfg, std::move(deps), std::move(policies));

        {
            ShutdownSignalWatcher watcher(shutdown_signals, [server] { server->stop(); });
            server->start();
        }

        events->shutdown();
        utils::log::info("Gatekeeper stopped");

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return 1;
    }

    return 0;
}
