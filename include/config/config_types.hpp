#pragma once

#include "auth/identity_provider.hpp"
#include "server/limit_registry.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gatekeeper {

// ============================================================================
// Configuration Types
// ============================================================================

struct TlsConfig {
    bool enabled = false;
    std::string cert_file;            // Server certificate (PEM)
    std::string key_file;             // Server private key (PEM)
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8080;
    size_t thread_pool_size = 8;
    std::vector<std::string> trusted_proxies;   // IPv4 / CIDR allowed to set X-Forwarded-For
    TlsConfig tls;
};

struct LoggingConfig {
    std::string level = "info";
};

struct UpstreamConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 3000;
    uint32_t timeout_ms = 30000;
};

/**
 * @brief [[admission.policies]] entry; limits are referenced by registry name
 */
struct PolicyConfigEntry {
    std::string group;
    std::string prefix;                       // empty = group name
    std::optional<std::string> user_limit;
    std::optional<std::string> ip_limit;
    int64_t max_concurrent = 0;
};

struct AdmissionConfig {
    bool bypass = false;
    uint32_t sweep_interval_seconds = 300;
    std::vector<LimitEntry> limits;           // overrides of the standard table
    std::vector<PolicyConfigEntry> policies;  // overrides of the standard policies
};

struct EventsConfig {
    bool log_sink = true;
    std::string file;                         // empty = no file sink
    size_t queue_capacity = 4096;
};

/**
 * @brief HTTP route guarded by the policy of an endpoint group
 */
struct RouteConfig {
    std::string path;
    std::string group;                        // empty = forwarded unthrottled
};

/**
 * @brief RPC procedure forwarded to the backend
 */
struct ProcedureConfig {
    std::string name;
    std::string group;                        // empty = unthrottled
};

// ============================================================================
// GatewayConfig - Complete parsed configuration
// ============================================================================

struct GatewayConfig {
    ServerConfig server;
    LoggingConfig logging;
    UpstreamConfig upstream;
    AdmissionConfig admission;
    EventsConfig events;
    std::vector<UserInfo> users;
    std::vector<RouteConfig> routes;
    std::vector<ProcedureConfig> procedures;
};

} // namespace gatekeeper
