#include "config/config_loader.hpp"
#include "server/trusted_proxies.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <limits>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace gatekeeper {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 *
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_node(toml::node& node);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        expand_env_vars_in_node(val);
    }
}

void expand_env_vars_in_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        auto expanded = expand_env_vars(s->get());
        if (expanded != s->get()) {
            *s = std::move(expanded);
        }
    } else if (auto* tbl = node.as_table()) {
        expand_env_vars_recursive(*tbl);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) {
            expand_env_vars_in_node(elem);
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

std::optional<std::string> toml_optional_string(const toml::table& tbl, const std::string_view key) {
    if (const auto* v = tbl[key].as_string()) {
        return std::string(v->get());
    }
    return std::nullopt;
}

bool is_valid_log_level(const std::string& level) {
    static const std::unordered_set<std::string> levels = {
        "debug", "info", "warn", "warning", "error"};
    return levels.contains(utils::to_lower(level));
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

ServerConfig ConfigLoader::extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or("0.0.0.0"s);
    cfg.port = static_cast<uint16_t>(s["port"].value_or(8080));
    cfg.thread_pool_size = static_cast<size_t>(s["threads"].value_or(8));
    cfg.trusted_proxies = toml_string_array(s, "trusted_proxies");

    if (const auto* tls = s["tls"].as_table()) {
        cfg.tls.enabled = (*tls)["enabled"].value_or(false);
        cfg.tls.cert_file = (*tls)["cert_file"].value_or(""s);
        cfg.tls.key_file = (*tls)["key_file"].value_or(""s);
    }
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* logging = root["logging"].as_table()) {
        cfg.level = (*logging)["level"].value_or("info"s);
    }
    return cfg;
}

UpstreamConfig ConfigLoader::extract_upstream(const toml::table& root) {
    UpstreamConfig cfg;
    const auto* upstream = root["upstream"].as_table();
    if (!upstream) return cfg;
    const auto& u = *upstream;

    cfg.host = u["host"].value_or("127.0.0.1"s);
    cfg.port = static_cast<uint16_t>(u["port"].value_or(3000));
    cfg.timeout_ms = static_cast<uint32_t>(u["timeout_ms"].value_or(30000));
    return cfg;
}

AdmissionConfig ConfigLoader::extract_admission(const toml::table& root) {
    AdmissionConfig cfg;
    const auto* admission = root["admission"].as_table();
    if (!admission) return cfg;
    const auto& a = *admission;

    cfg.bypass = a["bypass"].value_or(false);
    cfg.sweep_interval_seconds = static_cast<uint32_t>(a["sweep_interval_seconds"].value_or(300));

    if (const auto* limits = a["limits"].as_array()) {
        for (const auto& elem : *limits) {
            const auto* l = elem.as_table();
            if (!l) continue;
            LimitEntry entry;
            entry.name = (*l)["name"].value_or(""s);
            entry.limit = (*l)["limit"].value_or(int64_t{0});
            entry.window_ms = (*l)["window_ms"].value_or(int64_t{0});
            cfg.limits.push_back(std::move(entry));
        }
    }

    if (const auto* policies = a["policies"].as_array()) {
        for (const auto& elem : *policies) {
            const auto* p = elem.as_table();
            if (!p) continue;
            PolicyConfigEntry entry;
            entry.group = (*p)["group"].value_or(""s);
            entry.prefix = (*p)["prefix"].value_or(""s);
            entry.user_limit = toml_optional_string(*p, "user_limit");
            entry.ip_limit = toml_optional_string(*p, "ip_limit");
            entry.max_concurrent = (*p)["max_concurrent"].value_or(int64_t{0});
            cfg.policies.push_back(std::move(entry));
        }
    }
    return cfg;
}

EventsConfig ConfigLoader::extract_events(const toml::table& root) {
    EventsConfig cfg;
    const auto* events = root["events"].as_table();
    if (!events) return cfg;
    const auto& e = *events;

    cfg.log_sink = e["log"].value_or(true);
    cfg.file = e["file"].value_or(""s);
    cfg.queue_capacity = static_cast<size_t>(e["queue_capacity"].value_or(4096));
    return cfg;
}

std::vector<UserInfo> ConfigLoader::extract_users(const toml::table& root) {
    std::vector<UserInfo> result;
    const auto* arr = root["users"].as_array();
    if (!arr) return result;

    for (const auto& elem : *arr) {
        const auto* u = elem.as_table();
        if (!u) continue;

        UserInfo info;
        info.id = (*u)["id"].value_or(""s);
        info.name = (*u)["name"].value_or(info.id);
        info.api_key = (*u)["api_key"].value_or(""s);
        info.roles = toml_string_array(*u, "roles");
        result.push_back(std::move(info));
    }
    return result;
}

std::vector<RouteConfig> ConfigLoader::extract_routes(const toml::table& root) {
    std::vector<RouteConfig> result;
    const auto* arr = root["routes"].as_array();
    if (!arr) return result;

    for (const auto& elem : *arr) {
        const auto* r = elem.as_table();
        if (!r) continue;
        result.push_back(RouteConfig{
            .path = (*r)["path"].value_or(""s),
            .group = (*r)["group"].value_or(""s),
        });
    }
    return result;
}

std::vector<ProcedureConfig> ConfigLoader::extract_procedures(const toml::table& root) {
    std::vector<ProcedureConfig> result;
    const auto* arr = root["procedures"].as_array();
    if (!arr) return result;

    for (const auto& elem : *arr) {
        const auto* p = elem.as_table();
        if (!p) continue;
        result.push_back(ProcedureConfig{
            .name = (*p)["name"].value_or(""s),
            .group = (*p)["group"].value_or(""s),
        });
    }
    return result;
}

// ---- Policies --------------------------------------------------------------

std::vector<AdmissionPolicy> ConfigLoader::build_policies(const AdmissionConfig& config,
                                                          const LimitRegistry& registry) {
    auto result = policies::standard_all(registry);

    for (const auto& entry : config.policies) {
        const auto group = parse_endpoint_group(entry.group);
        if (!group) {
            throw ConfigError(std::format("unknown endpoint group '{}'", entry.group));
        }
        if (entry.max_concurrent < 0) {
            throw ConfigError(std::format(
                "policy '{}': max_concurrent must be >= 0, got {}", entry.group, entry.max_concurrent));
        }
        if (entry.max_concurrent > std::numeric_limits<uint32_t>::max()) {
            throw ConfigError(std::format(
                "policy '{}': max_concurrent {} out of range", entry.group, entry.max_concurrent));
        }

        AdmissionPolicy policy;
        policy.group = *group;
        policy.prefix = entry.prefix.empty() ? entry.group : entry.prefix;
        if (entry.user_limit) policy.user_limit = registry.get(*entry.user_limit);
        if (entry.ip_limit) policy.ip_limit = registry.get(*entry.ip_limit);
        policy.max_concurrent = static_cast<uint32_t>(entry.max_concurrent);

        bool replaced = false;
        for (auto& existing : result) {
            if (existing.group == policy.group) {
                existing = policy;
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            result.push_back(std::move(policy));
        }
    }
    return result;
}

// ---- Shared extraction + validation ----------------------------------------

GatewayConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    GatewayConfig config;
    config.server = extract_server(tbl);
    config.logging = extract_logging(tbl);
    config.upstream = extract_upstream(tbl);
    config.admission = extract_admission(tbl);
    config.events = extract_events(tbl);
    config.users = extract_users(tbl);
    config.routes = extract_routes(tbl);
    config.procedures = extract_procedures(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(GatewayConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const GatewayConfig& config) {
    std::vector<std::string> errors;

    if (config.server.port == 0) {
        errors.push_back("server.port must be 1-65535");
    }
    if (config.server.thread_pool_size == 0) {
        errors.push_back("server.threads must be > 0");
    }
    if (config.server.tls.enabled) {
        if (config.server.tls.cert_file.empty()) {
            errors.push_back("server.tls.cert_file required when TLS is enabled");
        }
        if (config.server.tls.key_file.empty()) {
            errors.push_back("server.tls.key_file required when TLS is enabled");
        }
    }
    for (const auto& proxy : config.server.trusted_proxies) {
        TrustedProxySet::CidrRange range;
        if (!TrustedProxySet::parse_cidr(proxy, range)) {
            errors.push_back(std::format("server.trusted_proxies: invalid entry '{}'", proxy));
        }
    }

    if (!is_valid_log_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug|info|warn|error, got '{}'",
                                     config.logging.level));
    }

    if (config.upstream.port == 0) {
        errors.push_back("upstream.port must be 1-65535");
    }

    // Limits: report every bad entry, not just the first
    std::unordered_set<std::string> limit_names;
    for (size_t i = 0; i < config.admission.limits.size(); ++i) {
        const auto& l = config.admission.limits[i];
        if (l.name.empty()) {
            errors.push_back(std::format("admission.limits[{}].name must not be empty", i));
        } else if (!limit_names.insert(l.name).second) {
            errors.push_back(std::format("admission.limits[{}]: duplicate name '{}'", i, l.name));
        }
        if (l.limit <= 0) {
            errors.push_back(std::format("admission.limits[{}].limit must be > 0, got {}", i, l.limit));
        }
        if (l.window_ms <= 0) {
            errors.push_back(std::format("admission.limits[{}].window_ms must be > 0, got {}", i, l.window_ms));
        }
    }

    // Policies only resolve against a valid registry
    std::vector<AdmissionPolicy> resolved;
    if (errors.empty()) {
        try {
            const LimitRegistry registry(config.admission.limits);
            resolved = build_policies(config.admission, registry);
        } catch (const ConfigError& e) {
            errors.push_back(std::format("admission.policies: {}", e.what()));
        }
    }

    const auto has_policy = [&resolved](EndpointGroup group) {
        for (const auto& p : resolved) {
            if (p.group == group) return true;
        }
        return false;
    };

    const auto check_group = [&](std::string_view where, const std::string& group) {
        if (group.empty()) return;
        const auto parsed = parse_endpoint_group(group);
        if (!parsed) {
            errors.push_back(std::format("{}: unknown endpoint group '{}'", where, group));
        } else if (!resolved.empty() && !has_policy(*parsed)) {
            errors.push_back(std::format("{}: no admission policy for group '{}'", where, group));
        }
    };

    std::unordered_set<std::string> user_ids;
    std::unordered_set<std::string> api_keys;
    for (size_t i = 0; i < config.users.size(); ++i) {
        const auto& u = config.users[i];
        if (u.id.empty()) {
            errors.push_back(std::format("users[{}].id must not be empty", i));
        } else if (!user_ids.insert(u.id).second) {
            errors.push_back(std::format("users[{}]: duplicate id '{}'", i, u.id));
        }
        if (u.api_key.empty()) {
            errors.push_back(std::format("users[{}].api_key must not be empty", i));
        } else if (!api_keys.insert(u.api_key).second) {
            errors.push_back(std::format("users[{}]: api_key already in use", i));
        }
    }

    for (size_t i = 0; i < config.routes.size(); ++i) {
        const auto& r = config.routes[i];
        if (r.path.empty() || r.path.front() != '/') {
            errors.push_back(std::format("routes[{}].path must start with '/'", i));
        }
        check_group(std::format("routes[{}]", i), r.group);
    }

    std::unordered_set<std::string> procedure_names;
    for (size_t i = 0; i < config.procedures.size(); ++i) {
        const auto& p = config.procedures[i];
        if (p.name.empty()) {
            errors.push_back(std::format("procedures[{}].name must not be empty", i));
        } else if (!procedure_names.insert(p.name).second) {
            errors.push_back(std::format("procedures[{}]: duplicate name '{}'", i, p.name));
        }
        check_group(std::format("procedures[{}]", i), p.group);
    }

    if (config.events.queue_capacity == 0) {
        errors.push_back("events.queue_capacity must be > 0");
    }

    return errors;
}

} // namespace gatekeeper
