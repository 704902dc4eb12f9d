#pragma once

#include "events/event_sink.hpp"
#include "events/rate_limit_event.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace gatekeeper {

/**
 * @brief Async operational event emitter
 *
 * Request threads call emit(), which only enqueues. A background writer
 * drains the queue, serializes each event and writes it to every sink.
 *
 *   [Thread 1] --emit()--> [bounded queue] --> [Writer Thread] --> [Sink: log]
 *   [Thread N] --emit()-->                                     --> [Sink: file]
 *
 * A full queue drops the event. Sink failures are counted and logged,
 * never surfaced to the producer.
 */
class EventEmitter {
public:
    struct Config {
        size_t queue_capacity = 4096;
        std::chrono::milliseconds batch_flush_interval{100};
    };

    /// Starts the background writer thread immediately
    EventEmitter(const Config& config, std::vector<std::unique_ptr<IEventSink>> sinks);

    ~EventEmitter();

    EventEmitter(const EventEmitter&) = delete;
    EventEmitter& operator=(const EventEmitter&) = delete;
    EventEmitter(EventEmitter&&) = delete;
    EventEmitter& operator=(EventEmitter&&) = delete;

    /**
     * @brief Enqueue an event (non-blocking)
     * @return false if dropped (queue full or emitter stopped)
     */
    bool emit(RateLimitEvent event);

    /// Block until every event emitted so far has reached the sinks
    void flush();

    /// Drain, flush and close all sinks; idempotent
    void shutdown();

    struct Stats {
        uint64_t total_emitted;       ///< Events accepted into the queue
        uint64_t total_written;       ///< Events handed to sinks
        uint64_t dropped;             ///< Events rejected (queue full / stopped)
        uint64_t sink_write_failures; ///< Failed sink write attempts
        size_t active_sinks;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    void writer_thread_func();
    void write_batch(const std::deque<RateLimitEvent>& batch);
    void write_to_sinks(std::string_view line);
    void flush_sinks();
    void shutdown_sinks();

    Config config_;
    std::vector<std::unique_ptr<IEventSink>> sinks_;

    // Guarded by mutex_
    std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable drained_cv_;
    std::deque<RateLimitEvent> queue_;
    bool running_ = false;
    uint64_t flush_requested_gen_ = 0;   // bumped by every flush() call
    uint64_t flush_completed_gen_ = 0;   // highest generation the writer has flushed

    std::thread writer_thread_;

    std::atomic<uint64_t> total_emitted_{0};
    std::atomic<uint64_t> total_written_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> sink_write_failures_{0};
};

} // namespace gatekeeper
