#pragma once

#include "capture/capture.hpp"
#include "capture/capture_step.hpp"
#include "capture/exchange_assembler.hpp"
#include "capture/ibrowser_driver.hpp"
#include "capture/ingest_queue.hpp"
#include "capture/iproxy_transport.hpp"
#include "core/error.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace webcapture {

inline constexpr std::string_view kSoftwareName = "webcapture";
inline constexpr std::string_view kSoftwareVersion = "1.0.0";

/**
 * @brief Drives one capture through INIT → SETUP → CAPTURE → TEARDOWN → COMPLETE
 *
 * Owns the proxy transport and the browser page for the capture's lifetime
 * and releases both exactly once, on every exit path.
 *
 * Flow:
 * 1. SETUP: start the ingest thread, start the proxy, launch the browser.
 *    Failure here is the only fatal error (SETUP_ERROR, state ERROR).
 * 2. CAPTURE: run steps in order. Pending chunks are flushed into the
 *    assembler before each step; once the state has left CAPTURE (size
 *    budget reached) no further step starts. Step failures and overruns
 *    are logged and skipped.
 * 3. teardown(), drain remaining chunks, attach provenance, COMPLETE.
 *
 * teardown() is also the assembler's budget callback and may run on the
 * ingest thread concurrently with the pipeline; the state guard makes
 * the second call a no-op that waits for the first to finish releasing.
 */
class CaptureController {
public:
    CaptureController(Capture& capture,
                      std::unique_ptr<IBrowserDriver> browser_driver,
                      std::unique_ptr<IProxyTransport> proxy);

    ~CaptureController();

    CaptureController(const CaptureController&) = delete;
    CaptureController& operator=(const CaptureController&) = delete;

    /**
     * @brief Run the whole capture
     * @return terminal state (COMPLETE), or SETUP_ERROR when the browser or
     *         proxy could not be acquired, or INTERNAL_ERROR when called twice
     */
    [[nodiscard]] Result<CaptureState> capture();

    /// Enter TEARDOWN and release browser + proxy. Idempotent, thread-safe.
    void teardown();

    /// Proxy-facing entry point: queue the chunk, return it unchanged
    std::string_view on_chunk(const std::string& session_id, Direction direction,
                              std::string_view chunk);

    [[nodiscard]] ExchangeAssembler& assembler() { return assembler_; }

    /// Number of times browser/proxy resources were released (0 or 1)
    [[nodiscard]] uint32_t release_count() const {
        return release_count_.load(std::memory_order_relaxed);
    }

private:
    [[nodiscard]] bool setup();
    void run_steps(std::vector<std::unique_ptr<ICaptureStep>>& steps);
    void release_resources_locked();
    [[nodiscard]] nlohmann::json build_provenance_info(const std::string& capture_start,
                                                       const std::string& capture_end) const;

    Capture& capture_;
    std::unique_ptr<IBrowserDriver> browser_driver_;
    std::unique_ptr<IProxyTransport> proxy_;

    ExchangeAssembler assembler_;
    std::unique_ptr<IngestQueue> ingest_queue_;

    // Live resources (valid between setup and release)
    std::unique_ptr<IBrowserPage> page_;
    bool proxy_started_ = false;
    bool resources_released_ = false;
    std::string user_agent_;
    std::string setup_error_;

    std::mutex teardown_mutex_;
    std::atomic<uint32_t> release_count_{0};
};

} // namespace webcapture
