#pragma once

#include "events/event_sink.hpp"
#include <cstddef>
#include <fstream>
#include <string>

namespace gatekeeper {

/**
 * @brief Appends events as JSONL to a file
 *
 * Missing parent directories are created on construction.
 * Called exclusively from the EventEmitter writer thread.
 */
class FileEventSink : public IEventSink {
public:
    /// @throws std::runtime_error if the directory or file cannot be created
    explicit FileEventSink(std::string output_file);
    ~FileEventSink() override;

    [[nodiscard]] bool write(std::string_view json_line) override;
    void flush() override;
    void shutdown() override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] size_t bytes_written() const { return bytes_written_; }

private:
    std::string output_file_;
    std::ofstream file_stream_;
    size_t bytes_written_ = 0;
};

} // namespace gatekeeper
