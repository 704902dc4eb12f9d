#include <catch2/catch_test_macros.hpp>
#include "events/event_emitter.hpp"
#include "events/file_sink.hpp"
#include "events/rate_limit_event.hpp"
#include "core/utils.hpp"
#include "mocks/mock_event_sink.hpp"

#include <glaze/glaze.hpp>

#include <atomic>
#include <filesystem>
#include <format>
#include <fstream>
#include <mutex>
#include <thread>
#include <vector>

using namespace gatekeeper;
using gatekeeper::testing::MockEventSink;

namespace {

RateLimitEvent sample_event(uint32_t retry_after = 60) {
    return make_rate_limit_event(EndpointGroup::AUTH, retry_after, std::nullopt, "192.0.2.1");
}

std::unique_ptr<EventEmitter> make_emitter(const std::shared_ptr<MockEventSink::State>& state,
                                           size_t capacity = 4096) {
    std::vector<std::unique_ptr<IEventSink>> sinks;
    sinks.push_back(std::make_unique<MockEventSink>(state));
    EventEmitter::Config config;
    config.queue_capacity = capacity;
    config.batch_flush_interval = std::chrono::milliseconds(10);
    return std::make_unique<EventEmitter>(config, std::move(sinks));
}

} // anonymous namespace

TEST_CASE("short_hash: 16 lowercase hex chars, deterministic", "[events]") {
    // SHA-256("abc") = ba7816bf8f01cfea...
    REQUIRE(utils::short_hash("abc") == "ba7816bf8f01cfea");
    REQUIRE(utils::short_hash("203.0.113.9") == utils::short_hash("203.0.113.9"));
    REQUIRE(utils::short_hash("u1") != utils::short_hash("u2"));

    const auto h = utils::short_hash("");
    REQUIRE(h.size() == 16);
    for (const char c : h) {
        REQUIRE(((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')));
    }
}

TEST_CASE("RateLimitEvent: fields and JSON shape", "[events]") {
    SECTION("Authenticated caller") {
        const auto event = make_rate_limit_event(EndpointGroup::EVIDENCE, 42, std::string("u1"), "198.51.100.2");
        REQUIRE(event.endpoint_group == "evidence");
        REQUIRE(event.event_type == "rate_limited");
        REQUIRE(event.status_code == 429);
        REQUIRE(event.retry_after_seconds == 42);
        REQUIRE(event.user_id_hash == utils::short_hash("u1"));
        REQUIRE(event.ip_hash == utils::short_hash("198.51.100.2"));
        REQUIRE_FALSE(event.request_id.empty());
        REQUIRE_FALSE(event.timestamp.empty());

        glz::json_t json;
        REQUIRE_FALSE(glz::read_json(json, to_json(event)));
        REQUIRE(json["endpointGroup"].get<std::string>() == "evidence");
        REQUIRE(json["userIdHash"].get<std::string>() == utils::short_hash("u1"));
        REQUIRE(json["retryAfterSeconds"].get<double>() == 42.0);
    }

    SECTION("Anonymous caller has no user hash") {
        const auto event = sample_event();
        REQUIRE_FALSE(event.user_id_hash.has_value());
        REQUIRE(event.ip_hash.has_value());
        REQUIRE(to_json(event).find("userIdHash") == std::string::npos);
    }

    SECTION("Unknown IP is still hashed") {
        const auto event = make_rate_limit_event(EndpointGroup::AUTH, 1, std::nullopt, "unknown");
        REQUIRE(event.ip_hash == utils::short_hash("unknown"));
    }

    SECTION("Empty IP is omitted") {
        const auto event = make_rate_limit_event(EndpointGroup::AUTH, 1, std::nullopt, "");
        REQUIRE_FALSE(event.ip_hash.has_value());
    }
}

TEST_CASE("EventEmitter: delivers every event to the sinks", "[events]") {
    auto state = std::make_shared<MockEventSink::State>();
    auto emitter = make_emitter(state);

    for (uint32_t i = 1; i <= 5; ++i) {
        REQUIRE(emitter->emit(sample_event(i)));
    }
    emitter->flush();

    const auto lines = state->snapshot();
    REQUIRE(lines.size() == 5);
    REQUIRE(lines[0].find(R"("retryAfterSeconds":1)") != std::string::npos);
    REQUIRE(state->flushes.load() >= 1);

    const auto stats = emitter->get_stats();
    REQUIRE(stats.total_emitted == 5);
    REQUIRE(stats.total_written == 5);
    REQUIRE(stats.dropped == 0);
    REQUIRE(stats.active_sinks == 1);
}

TEST_CASE("EventEmitter: concurrent flush waits for each caller's own events", "[events]") {
    auto state = std::make_shared<MockEventSink::State>();
    auto emitter = make_emitter(state);

    constexpr int num_threads = 8;
    constexpr int rounds = 50;
    std::atomic<int> missing{0};
    std::atomic<bool> go{false};

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t] {
            while (!go.load(std::memory_order_acquire)) {}
            for (int r = 0; r < rounds; ++r) {
                const auto retry_after = static_cast<uint32_t>(1000 + t * rounds + r);
                if (!emitter->emit(sample_event(retry_after))) {
                    missing.fetch_add(1);
                    continue;
                }
                emitter->flush();
                const auto needle = std::format(R"("retryAfterSeconds":{})", retry_after);
                bool found = false;
                for (const auto& line : state->snapshot()) {
                    if (line.find(needle) != std::string::npos) {
                        found = true;
                        break;
                    }
                }
                if (!found) missing.fetch_add(1);
            }
        });
    }

    go.store(true, std::memory_order_release);
    for (auto& th : threads) th.join();

    REQUIRE(missing.load() == 0);
    REQUIRE(state->snapshot().size() == static_cast<size_t>(num_threads * rounds));
}

TEST_CASE("EventEmitter: full queue drops instead of blocking", "[events]") {
    auto state = std::make_shared<MockEventSink::State>();
    auto emitter = make_emitter(state, 2);

    std::unique_lock<std::mutex> stall(state->hold);
    int accepted = 0;
    for (int i = 0; i < 10; ++i) {
        if (emitter->emit(sample_event())) ++accepted;
    }
    // At most one batch in the writer plus a full queue
    REQUIRE(accepted <= 4);
    auto stats = emitter->get_stats();
    REQUIRE(stats.dropped == static_cast<uint64_t>(10 - accepted));
    stall.unlock();

    emitter->flush();
    REQUIRE(state->snapshot().size() == static_cast<size_t>(accepted));
}

TEST_CASE("EventEmitter: sink failures are counted, not propagated", "[events]") {
    auto state = std::make_shared<MockEventSink::State>();
    auto emitter = make_emitter(state);

    SECTION("Sink reports failure") {
        state->fail_writes = true;
        REQUIRE(emitter->emit(sample_event()));
        emitter->flush();
        REQUIRE(emitter->get_stats().sink_write_failures == 1);
    }

    SECTION("Sink throws") {
        state->throw_on_write = true;
        REQUIRE(emitter->emit(sample_event()));
        REQUIRE(emitter->emit(sample_event()));
        emitter->flush();
        REQUIRE(emitter->get_stats().sink_write_failures == 2);

        state->throw_on_write = false;
        REQUIRE(emitter->emit(sample_event()));
        emitter->flush();
        REQUIRE(state->snapshot().size() == 1);
    }
}

TEST_CASE("EventEmitter: shutdown drains and closes sinks", "[events]") {
    auto state = std::make_shared<MockEventSink::State>();
    auto emitter = make_emitter(state);

    REQUIRE(emitter->emit(sample_event()));
    REQUIRE(emitter->emit(sample_event()));
    emitter->shutdown();

    REQUIRE(state->snapshot().size() == 2);
    REQUIRE(state->shut_down.load());

    // Idempotent, and later events are dropped
    emitter->shutdown();
    REQUIRE_FALSE(emitter->emit(sample_event()));
    REQUIRE(emitter->get_stats().dropped == 1);
    emitter->flush();
}

TEST_CASE("FileEventSink: appends JSONL", "[events]") {
    const auto path = std::filesystem::temp_directory_path() / "gatekeeper_events_test.jsonl";
    std::filesystem::remove(path);

    {
        std::vector<std::unique_ptr<IEventSink>> sinks;
        sinks.push_back(std::make_unique<FileEventSink>(path.string()));
        EventEmitter emitter(EventEmitter::Config{}, std::move(sinks));
        REQUIRE(emitter.emit(sample_event(5)));
        REQUIRE(emitter.emit(sample_event(6)));
        emitter.shutdown();
    }

    std::ifstream in(path);
    std::string line;
    std::vector<std::string> lines;
    while (std::getline(in, line)) lines.push_back(line);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[1].find(R"("retryAfterSeconds":6)") != std::string::npos);

    std::filesystem::remove(path);
}

TEST_CASE("FileEventSink: creates missing parent directories", "[events]") {
    const auto root = std::filesystem::temp_directory_path() / "gatekeeper_events_dir_test";
    std::filesystem::remove_all(root);
    const auto path = root / "logs" / "rate_limit_events.jsonl";

    {
        FileEventSink sink(path.string());
        REQUIRE(sink.write(R"({"eventType":"rate_limited"})"));
        sink.shutdown();
    }
    REQUIRE(std::filesystem::is_regular_file(path));

    std::filesystem::remove_all(root);
}

TEST_CASE("FileEventSink: unopenable path throws", "[events]") {
    const auto blocker = std::filesystem::temp_directory_path() / "gatekeeper_events_blocker";
    std::filesystem::remove_all(blocker);
    std::ofstream(blocker) << "not a directory";

    REQUIRE_THROWS_AS(FileEventSink((blocker / "events.jsonl").string()), std::runtime_error);

    std::filesystem::remove(blocker);
}
