#pragma once

#include <string>
#include <string_view>

namespace gatekeeper {

/**
 * @brief Abstract interface for operational event destinations
 *
 * Each sink receives serialized JSON lines from the EventEmitter's
 * writer thread. Implementations are only called from that thread,
 * so no internal locking is needed.
 */
class IEventSink {
public:
    virtual ~IEventSink() = default;

    /// Write a single JSON-serialized event. Returns true on success.
    [[nodiscard]] virtual bool write(std::string_view json_line) = 0;

    /// Flush any buffered data to the underlying storage.
    virtual void flush() = 0;

    /// Graceful shutdown (drain buffers, close handles).
    virtual void shutdown() = 0;

    /// Human-readable sink name for logging (e.g. "file:/var/log/gatekeeper/events.jsonl")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace gatekeeper
