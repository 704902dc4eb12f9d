#include "events/log_sink.hpp"
#include "core/utils.hpp"

#include <format>

namespace gatekeeper {

bool LogEventSink::write(std::string_view json_line) {
    utils::log::info(std::format("event {}", json_line));
    return true;
}

} // namespace gatekeeper
