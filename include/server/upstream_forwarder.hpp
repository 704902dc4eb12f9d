#pragma once

#include <httplib.h>

#include <atomic>
#include <cstdint>
#include <string>

namespace gatekeeper {

/**
 * @brief Forwards admitted calls to the application backend
 *
 * One httplib::Client per call (cpp-httplib clients are not shared
 * across threads). Connection failures become 502 responses; the
 * backend's own status codes pass through unchanged.
 */
class UpstreamForwarder {
public:
    struct Config {
        std::string host = "127.0.0.1";
        uint16_t port = 3000;
        uint32_t timeout_ms = 30000;
    };

    explicit UpstreamForwarder(const Config& config);

    /**
     * @brief Replay req against the backend and copy the reply into res
     */
    void forward(const httplib::Request& req, httplib::Response& res);

    struct Result {
        bool ok = false;
        int status = 0;
        std::string body;
        std::string content_type;
        std::string error;
    };

    /**
     * @brief POST body to /rpc/<procedure> on the backend
     */
    [[nodiscard]] Result forward_rpc(const std::string& procedure, const std::string& body,
                                     const std::string& auth_header);

    struct Stats {
        uint64_t forwarded;
        uint64_t upstream_errors;
    };
    [[nodiscard]] Stats get_stats() const;

    [[nodiscard]] std::string base_url() const;

private:
    [[nodiscard]] httplib::Client make_client() const;

    Config config_;
    std::atomic<uint64_t> forwarded_{0};
    std::atomic<uint64_t> upstream_errors_{0};
};

} // namespace gatekeeper
