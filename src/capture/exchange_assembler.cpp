#include "capture/exchange_assembler.hpp"

#include <format>

namespace webcapture {

ExchangeAssembler::ExchangeAssembler(Capture& capture, BudgetExceededCallback on_budget_exceeded)
    : capture_(capture), on_budget_exceeded_(std::move(on_budget_exceeded)) {}

std::string_view ExchangeAssembler::ingest(const std::string& session_id, Direction direction,
                                           std::string_view chunk) {
    // Zero-length chunks carry nothing to archive and must not open or
    // close an exchange
    if (chunk.empty()) {
        return chunk;
    }

    bool breached = false;
    uint64_t total = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ExchangeStore& store = capture_.store_;

        auto index = store.find_open(session_id, direction);
        if (!index) {
            index = store.create(session_id, utils::now_ms());
            exchanges_created_.fetch_add(1, std::memory_order_relaxed);
        }
        store.append(*index, direction, chunk);
        chunks_ingested_.fetch_add(1, std::memory_order_relaxed);
        total = store.total_size();

        // >= : the exchange that crosses the threshold is kept whole
        if (total >= capture_.options().max_size &&
            capture_.state() == CaptureState::CAPTURE &&
            !capture_.budget_exceeded_.exchange(true, std::memory_order_acq_rel)) {
            breached = true;
        }
    }

    if (breached) {
        capture_.add_log(std::format("Max size reached ({} >= {} bytes). Ending further capture.",
                                     total, capture_.options().max_size));
        if (on_budget_exceeded_) {
            on_budget_exceeded_();
        }
    }
    return chunk;
}

} // namespace webcapture
