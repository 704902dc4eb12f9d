#include "events/event_emitter.hpp"
#include "core/utils.hpp"

#include <format>

namespace gatekeeper {

// ============================================================================
// Construction / Destruction
// ============================================================================

EventEmitter::EventEmitter(const Config& config,
                           std::vector<std::unique_ptr<IEventSink>> sinks)
    : config_(config),
      sinks_(std::move(sinks)) {
    running_ = true;
    writer_thread_ = std::thread(&EventEmitter::writer_thread_func, this);
}

EventEmitter::~EventEmitter() {
    shutdown();
}

// ============================================================================
// Public Interface
// ============================================================================

bool EventEmitter::emit(RateLimitEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || queue_.size() >= config_.queue_capacity) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        queue_.push_back(std::move(event));
    }
    total_emitted_.fetch_add(1, std::memory_order_relaxed);
    work_cv_.notify_one();
    return true;
}

void EventEmitter::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!running_) return;

    const uint64_t target = ++flush_requested_gen_;
    work_cv_.notify_one();
    drained_cv_.wait(lock, [this, target] {
        return flush_completed_gen_ >= target || !running_;
    });
}

void EventEmitter::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
    }
    work_cv_.notify_one();

    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }
    drained_cv_.notify_all();
}

EventEmitter::Stats EventEmitter::get_stats() const {
    return Stats{
        .total_emitted = total_emitted_.load(std::memory_order_relaxed),
        .total_written = total_written_.load(std::memory_order_relaxed),
        .dropped = dropped_.load(std::memory_order_relaxed),
        .sink_write_failures = sink_write_failures_.load(std::memory_order_relaxed),
        .active_sinks = sinks_.size(),
    };
}

// ============================================================================
// Sink Helpers
// ============================================================================

void EventEmitter::write_to_sinks(std::string_view line) {
    for (auto& sink : sinks_) {
        try {
            if (!sink->write(line)) {
                sink_write_failures_.fetch_add(1, std::memory_order_relaxed);
            }
        } catch (const std::exception& e) {
            sink_write_failures_.fetch_add(1, std::memory_order_relaxed);
            utils::log::error(std::format("Event sink {} failed: {}", sink->name(), e.what()));
        }
    }
}

void EventEmitter::write_batch(const std::deque<RateLimitEvent>& batch) {
    for (const auto& event : batch) {
        try {
            write_to_sinks(to_json(event));
        } catch (const std::exception& e) {
            sink_write_failures_.fetch_add(1, std::memory_order_relaxed);
            utils::log::error(std::format("Event serialization failed: {}", e.what()));
        }
    }
    total_written_.fetch_add(batch.size(), std::memory_order_relaxed);
}

void EventEmitter::flush_sinks() {
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

void EventEmitter::shutdown_sinks() {
    for (auto& sink : sinks_) {
        sink->flush();
        sink->shutdown();
    }
}

// ============================================================================
// Background Writer Thread
// ============================================================================

void EventEmitter::writer_thread_func() {
    std::deque<RateLimitEvent> batch;

    while (true) {
        uint64_t flush_gen = 0;
        bool stopping = false;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait_for(lock, config_.batch_flush_interval, [this] {
                return !queue_.empty() || flush_requested_gen_ > flush_completed_gen_ || !running_;
            });
            batch.swap(queue_);
            // Captured with the batch: everything emitted before those flush() calls is in it
            if (flush_requested_gen_ > flush_completed_gen_) {
                flush_gen = flush_requested_gen_;
            }
            stopping = !running_;
        }

        if (!batch.empty()) {
            write_batch(batch);
            batch.clear();
        }

        if (flush_gen != 0) {
            flush_sinks();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                flush_completed_gen_ = flush_gen;
            }
            drained_cv_.notify_all();
        }

        if (stopping) {
            shutdown_sinks();
            return;
        }
    }
}

} // namespace gatekeeper
