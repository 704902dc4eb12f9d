#pragma once

#include "events/event_sink.hpp"

namespace gatekeeper {

/**
 * @brief Writes each event to the process log at INFO
 */
class LogEventSink : public IEventSink {
public:
    [[nodiscard]] bool write(std::string_view json_line) override;
    void flush() override {}
    void shutdown() override {}
    [[nodiscard]] std::string name() const override { return "log"; }
};

} // namespace gatekeeper
