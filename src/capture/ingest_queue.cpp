#include "capture/ingest_queue.hpp"
#include "capture/exchange_assembler.hpp"

namespace webcapture {

IngestQueue::IngestQueue(ExchangeAssembler& assembler)
    : assembler_(assembler) {
    ingest_thread_ = std::thread([this] { ingest_thread_func(); });
}

IngestQueue::~IngestQueue() {
    shutdown();
}

void IngestQueue::push(ChunkEvent event) {
    total_enqueued_.fetch_add(1, std::memory_order_relaxed);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!worker_exited_) {
            pending_.push_back(std::move(event));
            work_cv_.notify_one();
            return;
        }
    }
    // Queue already shut down: account the chunk inline
    assembler_.ingest(event.session_id, event.direction, event.bytes);
    total_ingested_.fetch_add(1, std::memory_order_relaxed);
}

void IngestQueue::flush() {
    if (std::this_thread::get_id() == ingest_thread_.get_id()) {
        return;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return pending_.empty() && !busy_; });
}

void IngestQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    work_cv_.notify_all();
    if (ingest_thread_.joinable() && std::this_thread::get_id() != ingest_thread_.get_id()) {
        ingest_thread_.join();
    }
}

// ============================================================================
// Ingest Thread
// ============================================================================

void IngestQueue::ingest_thread_func() {
    std::deque<ChunkEvent> batch;

    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this] { return !pending_.empty() || !running_; });
            if (pending_.empty()) {
                // Stopped and fully drained. Later pushes must see worker_exited_
                // under this same lock, or they would land in a dead queue.
                busy_ = false;
                worker_exited_ = true;
                idle_cv_.notify_all();
                return;
            }
            batch.swap(pending_);
            busy_ = true;
        }

        for (auto& event : batch) {
            assembler_.ingest(event.session_id, event.direction, event.bytes);
            total_ingested_.fetch_add(1, std::memory_order_relaxed);
        }
        batch.clear();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_ = false;
            if (pending_.empty()) {
                idle_cv_.notify_all();
            }
        }
    }
}

} // namespace webcapture
