#pragma once

#include "capture/exchange.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

namespace webcapture {

class ExchangeAssembler;

struct ChunkEvent {
    std::string session_id;
    Direction direction = Direction::REQUEST;
    std::string bytes;
};

/**
 * @brief Single-consumer feed from proxy delivery threads into the assembler
 *
 *   [Delivery thread 1] --push()--> [pending deque] --> [Ingest thread] --> ExchangeAssembler::ingest
 *   [Delivery thread N] --push()-->
 *
 * Producers never block on ingestion and nothing is dropped: the deque is
 * unbounded. Chunks are ingested in push order. Once the ingest thread
 * has drained and exited after shutdown(), push() ingests inline so late
 * data is still accounted.
 */
class IngestQueue {
public:
    explicit IngestQueue(ExchangeAssembler& assembler);
    ~IngestQueue();

    // Non-copyable, non-movable (owns thread)
    IngestQueue(const IngestQueue&) = delete;
    IngestQueue& operator=(const IngestQueue&) = delete;
    IngestQueue(IngestQueue&&) = delete;
    IngestQueue& operator=(IngestQueue&&) = delete;

    void push(ChunkEvent event);

    /// Block until every chunk pushed before this call has been ingested
    void flush();

    /// Drain remaining chunks, then stop the ingest thread. Idempotent.
    void shutdown();

    struct Stats {
        uint64_t total_enqueued;
        uint64_t total_ingested;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .total_enqueued = total_enqueued_.load(std::memory_order_relaxed),
            .total_ingested = total_ingested_.load(std::memory_order_relaxed),
        };
    }

private:
    void ingest_thread_func();

    ExchangeAssembler& assembler_;

    std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::deque<ChunkEvent> pending_;
    bool running_ = true;
    bool busy_ = false;
    bool worker_exited_ = false;

    std::thread ingest_thread_;

    std::atomic<uint64_t> total_enqueued_{0};
    std::atomic<uint64_t> total_ingested_{0};
};

} // namespace webcapture
