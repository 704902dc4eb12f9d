#pragma once

#include "config/config_types.hpp"
#include "server/admission_gate.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace gatekeeper {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        GatewayConfig config;

        [[nodiscard]] bool ok() const { return success; }
        [[nodiscard]] const std::string& error() const { return error_message; }

        static LoadResult ok(GatewayConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to gatekeeper.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Semantic checks run after extraction
     * @return One message per problem (empty = valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const GatewayConfig& config);

    /**
     * @brief Resolve the configured policies against the registry
     *
     * Starts from the standard policies; each [[admission.policies]] entry
     * replaces the policy of its group or adds one.
     * @throws ConfigError for an unknown group or limit name
     */
    [[nodiscard]] static std::vector<AdmissionPolicy> build_policies(
        const AdmissionConfig& config, const LimitRegistry& registry);

private:
    static GatewayConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(GatewayConfig config);

    static ServerConfig extract_server(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static UpstreamConfig extract_upstream(const toml::table& root);
    static AdmissionConfig extract_admission(const toml::table& root);
    static EventsConfig extract_events(const toml::table& root);
    static std::vector<UserInfo> extract_users(const toml::table& root);
    static std::vector<RouteConfig> extract_routes(const toml::table& root);
    static std::vector<ProcedureConfig> extract_procedures(const toml::table& root);
};

} // namespace gatekeeper
