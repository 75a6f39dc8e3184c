#pragma once

#include "capture/exchange.hpp"
#include "capture/exchange_store.hpp"
#include "config/capture_options.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace webcapture {

enum class CaptureState {
    INIT,
    SETUP,
    CAPTURE,
    TEARDOWN,
    COMPLETE,
    PARTIAL,
    ERROR
};

[[nodiscard]] inline constexpr std::string_view capture_state_name(CaptureState state) {
    switch (state) {
        case CaptureState::INIT:     return "INIT";
        case CaptureState::SETUP:    return "SETUP";
        case CaptureState::CAPTURE:  return "CAPTURE";
        case CaptureState::TEARDOWN: return "TEARDOWN";
        case CaptureState::COMPLETE: return "COMPLETE";
        case CaptureState::PARTIAL:  return "PARTIAL";
        case CaptureState::ERROR:    return "ERROR";
    }
    return "UNKNOWN";
}

struct LogEntry {
    utils::Timestamp timestamp;
    std::string message;
    bool is_warning = false;
    std::string trace;
    /// Set for failures, e.g. STEP_ERROR for a failed or expired step
    ErrorCategory category = ErrorCategory::NONE;
};

class ExchangeAssembler;
class CaptureController;
class ArchiveDecoder;

/**
 * @brief Aggregate root of one single-page capture
 *
 * Owns the exchange store, generated exchanges and logs. Only
 * ExchangeAssembler and CaptureController mutate the store during a
 * capture; ArchiveDecoder populates it when rebuilding from an archive.
 * Everything else sees the capture read-only.
 *
 * Thread safety: state is atomic; logs and generated exchanges are
 * guarded by an internal mutex; the store is guarded by the assembler.
 */
class Capture {
public:
    /**
     * @brief Create a capture for url with already-loaded options
     * @return CONFIGURATION_ERROR when url is not an http(s) url
     */
    [[nodiscard]] static Result<std::unique_ptr<Capture>> create(const std::string& url,
                                                                 CaptureOptions options);

    Capture(const Capture&) = delete;
    Capture& operator=(const Capture&) = delete;

    [[nodiscard]] const std::string& url() const { return url_; }
    [[nodiscard]] const CaptureOptions& options() const { return options_; }

    [[nodiscard]] CaptureState state() const {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] const ExchangeStore& store() const { return store_; }
    [[nodiscard]] const std::vector<Exchange>& exchanges() const { return store_.exchanges(); }
    [[nodiscard]] uint64_t total_size() const { return store_.total_size(); }

    [[nodiscard]] std::vector<GeneratedExchange> generated_exchanges() const;
    [[nodiscard]] std::vector<LogEntry> logs() const;
    [[nodiscard]] std::optional<nlohmann::json> provenance_info() const;

    /// True once the size budget tripped during CAPTURE
    [[nodiscard]] bool budget_exceeded() const {
        return budget_exceeded_.load(std::memory_order_acquire);
    }

    /**
     * @brief Append a log entry
     *
     * Echoed to utils::log when the verbose option is set.
     */
    void add_log(std::string message, bool is_warning = false, std::string trace = {},
                 ErrorCategory category = ErrorCategory::NONE);

private:
    Capture(std::string url, CaptureOptions options);

    friend class ExchangeAssembler;
    friend class CaptureController;
    friend class ArchiveDecoder;

    void set_state(CaptureState state) {
        state_.store(state, std::memory_order_release);
    }

    /// Atomically move from `expected` to `desired`; false if state differed
    bool transition(CaptureState expected, CaptureState desired) {
        return state_.compare_exchange_strong(expected, desired, std::memory_order_acq_rel);
    }

    void add_generated_exchange(GeneratedExchange exchange);
    void set_provenance_info(nlohmann::json info);

    std::string url_;
    CaptureOptions options_;
    std::atomic<CaptureState> state_{CaptureState::INIT};
    std::atomic<bool> budget_exceeded_{false};

    ExchangeStore store_;

    mutable std::mutex mutex_;
    std::vector<GeneratedExchange> generated_;
    std::vector<LogEntry> logs_;
    std::optional<nlohmann::json> provenance_info_;
};

} // namespace webcapture
