#include "events/rate_limit_event.hpp"
#include "core/utils.hpp"

#include <chrono>
#include <stdexcept>

namespace gatekeeper {

RateLimitEvent make_rate_limit_event(
    EndpointGroup group,
    uint32_t retry_after_seconds,
    const std::optional<std::string>& user_id,
    const std::string& ip) {

    RateLimitEvent event;
    event.request_id = utils::generate_uuid();
    event.endpoint_group = endpoint_group_to_string(group);
    event.retry_after_seconds = retry_after_seconds;
    if (user_id) {
        event.user_id_hash = utils::short_hash(*user_id);
    }
    if (!ip.empty()) {
        event.ip_hash = utils::short_hash(ip);
    }
    event.timestamp = utils::format_timestamp(std::chrono::system_clock::now());
    return event;
}

std::string to_json(const RateLimitEvent& event) {
    auto json = glz::write_json(event);
    if (!json) {
        throw std::runtime_error("Failed to serialize rate limit event");
    }
    return std::move(*json);
}

} // namespace gatekeeper
