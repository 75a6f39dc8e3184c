#pragma once

#include "capture/capture.hpp"
#include "capture/exchange.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace webcapture {

/**
 * @brief Turns tagged proxy chunks into exchanges and enforces the size budget
 *
 * Every ingest() is one atomic step against the store and the byte total
 * (internal mutex), whichever thread calls it.
 *
 * Selection rule per chunk: the most recent exchange of the session takes
 * it if the chunk is a response, or if it is a request and that exchange
 * has no response bytes yet. Otherwise a new exchange is appended. A
 * reused connection's next request therefore starts a new exchange while
 * a request split over several chunks keeps accumulating.
 *
 * Budget: when the total reaches max_size while the capture is in
 * CAPTURE, the breach is logged once and on_budget_exceeded fires (outside
 * the lock). Ingestion never stops: chunks that arrive after the breach or
 * after teardown are still stored and counted.
 */
class ExchangeAssembler {
public:
    using BudgetExceededCallback = std::function<void()>;

    ExchangeAssembler(Capture& capture, BudgetExceededCallback on_budget_exceeded);

    ExchangeAssembler(const ExchangeAssembler&) = delete;
    ExchangeAssembler& operator=(const ExchangeAssembler&) = delete;

    /**
     * @brief Ingest one chunk
     *
     * Empty chunks are ignored: an exchange has a response once response
     * bytes arrive, not when the transport signals an empty read.
     * @return chunk, unchanged, so the transport can forward it
     */
    std::string_view ingest(const std::string& session_id, Direction direction,
                            std::string_view chunk);

    struct Stats {
        uint64_t chunks_ingested;
        uint64_t exchanges_created;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .chunks_ingested = chunks_ingested_.load(std::memory_order_relaxed),
            .exchanges_created = exchanges_created_.load(std::memory_order_relaxed),
        };
    }

private:
    Capture& capture_;
    BudgetExceededCallback on_budget_exceeded_;
    std::mutex mutex_;

    std::atomic<uint64_t> chunks_ingested_{0};
    std::atomic<uint64_t> exchanges_created_{0};
};

} // namespace webcapture
