#include <catch2/catch_test_macros.hpp>
#include "capture/exchange_assembler.hpp"
#include "capture/ingest_queue.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace webcapture;

namespace {

std::unique_ptr<Capture> make_capture() {
    auto created = Capture::create("https://example.com", CaptureOptions{});
    REQUIRE(created.is_ok());
    return std::move(created.value());
}

} // anonymous namespace

TEST_CASE("IngestQueue: flush waits for every pushed chunk", "[ingest]") {
    auto capture = make_capture();
    ExchangeAssembler assembler(*capture, [] {});
    IngestQueue queue(assembler);

    for (int i = 0; i < 100; ++i) {
        queue.push(ChunkEvent{.session_id = "s", .direction = Direction::RESPONSE,
                              .bytes = "0123456789"});
    }
    queue.flush();

    CHECK(capture->total_size() == 1000);
    const auto stats = queue.get_stats();
    CHECK(stats.total_enqueued == 100);
    CHECK(stats.total_ingested == 100);
}

TEST_CASE("IngestQueue: per-producer order is preserved", "[ingest]") {
    auto capture = make_capture();
    ExchangeAssembler assembler(*capture, [] {});
    IngestQueue queue(assembler);

    constexpr int kProducers = 4;
    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&queue, p] {
            const std::string session = "p" + std::to_string(p);
            for (int i = 0; i < 50; ++i) {
                queue.push(ChunkEvent{.session_id = session, .direction = Direction::REQUEST,
                                      .bytes = std::to_string(i) + ","});
            }
        });
    }
    for (auto& t : producers) t.join();
    queue.flush();

    std::string expected;
    for (int i = 0; i < 50; ++i) expected += std::to_string(i) + ",";

    REQUIRE(capture->exchanges().size() == kProducers);
    for (const auto& exchange : capture->exchanges()) {
        CHECK(exchange.request_raw == expected);
    }
}

TEST_CASE("IngestQueue: shutdown drains and later pushes are still ingested", "[ingest]") {
    auto capture = make_capture();
    ExchangeAssembler assembler(*capture, [] {});
    IngestQueue queue(assembler);

    queue.push(ChunkEvent{.session_id = "s", .direction = Direction::REQUEST, .bytes = "abc"});
    queue.shutdown();
    CHECK(capture->total_size() == 3);

    queue.shutdown();  // idempotent
    queue.push(ChunkEvent{.session_id = "s", .direction = Direction::REQUEST, .bytes = "de"});
    queue.flush();

    CHECK(capture->total_size() == 5);
    REQUIRE(capture->exchanges().size() == 1);
    CHECK(capture->exchanges()[0].request_raw == "abcde");
    CHECK(queue.get_stats().total_ingested == 2);
}

TEST_CASE("IngestQueue: chunks pushed while shutdown runs are never lost", "[ingest]") {
    constexpr int kRuns = 50;
    constexpr int kProducers = 3;
    constexpr int kChunksPerProducer = 200;

    for (int run = 0; run < kRuns; ++run) {
        auto capture = make_capture();
        ExchangeAssembler assembler(*capture, [] {});
        IngestQueue queue(assembler);

        std::atomic<bool> go{false};
        std::vector<std::thread> producers;
        for (int p = 0; p < kProducers; ++p) {
            producers.emplace_back([&queue, &go, p] {
                const std::string session = "p" + std::to_string(p);
                while (!go.load()) std::this_thread::yield();
                for (int i = 0; i < kChunksPerProducer; ++i) {
                    queue.push(ChunkEvent{.session_id = session,
                                          .direction = Direction::REQUEST, .bytes = "x"});
                }
            });
        }
        go.store(true);
        queue.shutdown();
        for (auto& t : producers) t.join();

        REQUIRE(capture->total_size() == static_cast<size_t>(kProducers * kChunksPerProducer));
        const auto stats = queue.get_stats();
        CHECK(stats.total_ingested == stats.total_enqueued);
    }
}
