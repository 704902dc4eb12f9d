#include "events/file_sink.hpp"
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace gatekeeper {

FileEventSink::FileEventSink(std::string output_file)
    : output_file_(std::move(output_file)) {
    const auto parent = std::filesystem::path(output_file_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw std::runtime_error("Failed to create event directory " + parent.string() +
                                     ": " + ec.message());
        }
    }
    file_stream_.open(output_file_, std::ios::app);
    if (!file_stream_.is_open()) {
        throw std::runtime_error("Failed to open event file: " + output_file_);
    }
}

FileEventSink::~FileEventSink() {
    shutdown();
}

bool FileEventSink::write(std::string_view json_line) {
    if (!file_stream_.is_open()) return false;
    file_stream_.write(json_line.data(), static_cast<std::streamsize>(json_line.size()));
    file_stream_.put('\n');
    bytes_written_ += json_line.size() + 1;
    return file_stream_.good();
}

void FileEventSink::flush() {
    file_stream_.flush();
}

void FileEventSink::shutdown() {
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }
}

std::string FileEventSink::name() const {
    return "file:" + output_file_;
}

} // namespace gatekeeper
