#include "capture/capture_controller.hpp"
#include "capture/capture_steps.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace webcapture {

namespace {

bool is_terminal(CaptureState state) {
    return state == CaptureState::COMPLETE || state == CaptureState::PARTIAL ||
           state == CaptureState::ERROR;
}

} // anonymous namespace

CaptureController::CaptureController(Capture& capture,
                                     std::unique_ptr<IBrowserDriver> browser_driver,
                                     std::unique_ptr<IProxyTransport> proxy)
    : capture_(capture),
      browser_driver_(std::move(browser_driver)),
      proxy_(std::move(proxy)),
      assembler_(capture, [this] { teardown(); }) {}

CaptureController::~CaptureController() {
    {
        std::lock_guard<std::mutex> lock(teardown_mutex_);
        release_resources_locked();
    }
    if (ingest_queue_) {
        ingest_queue_->shutdown();
    }
}

std::string_view CaptureController::on_chunk(const std::string& session_id, Direction direction,
                                             std::string_view chunk) {
    if (ingest_queue_) {
        ingest_queue_->push(ChunkEvent{
            .session_id = session_id,
            .direction = direction,
            .bytes = std::string(chunk),
        });
        return chunk;
    }
    return assembler_.ingest(session_id, direction, chunk);
}

// ============================================================================
// capture()
// ============================================================================

Result<CaptureState> CaptureController::capture() {
    if (!capture_.transition(CaptureState::INIT, CaptureState::SETUP)) {
        return Result<CaptureState>::error(ErrorCategory::INTERNAL_ERROR,
            std::format("capture() requires state INIT (current: {})",
                        capture_state_name(capture_.state())));
    }

    const CaptureOptions& options = capture_.options();
    auto steps = build_capture_steps(options);

    if (!setup()) {
        capture_.set_state(CaptureState::ERROR);
        return Result<CaptureState>::error(ErrorCategory::SETUP_ERROR, setup_error_);
    }

    const std::string capture_start = utils::format_iso8601(utils::now_ms());
    capture_.add_log(std::format("Starting capture of {} with options: {}",
                                 capture_.url(), options_to_json(options).dump()));

    if (capture_.transition(CaptureState::SETUP, CaptureState::CAPTURE)) {
        run_steps(steps);
    }

    teardown();

    // Everything the proxy delivered before it stopped is ingested here
    ingest_queue_->shutdown();

    if (options.provenance_summary) {
        capture_.set_provenance_info(
            build_provenance_info(capture_start, utils::format_iso8601(utils::now_ms())));
    }

    capture_.set_state(CaptureState::COMPLETE);
    capture_.add_log(std::format("Capture complete: {} exchanges, {} generated, {} bytes",
                                 capture_.exchanges().size(),
                                 capture_.generated_exchanges().size(),
                                 capture_.total_size()));
    return Result<CaptureState>::ok(CaptureState::COMPLETE);
}

// ============================================================================
// Setup / Teardown
// ============================================================================

bool CaptureController::setup() {
    const CaptureOptions& options = capture_.options();
    const ProxyEndpoint endpoint{
        .host = options.proxy_host,
        .port = options.proxy_port,
        .verbose = options.proxy_verbose,
    };

    ingest_queue_ = std::make_unique<IngestQueue>(assembler_);

    try {
        proxy_->start(endpoint, [this](const std::string& session_id, Direction direction,
                                       std::string_view chunk) {
            return on_chunk(session_id, direction, chunk);
        });
        {
            std::lock_guard<std::mutex> lock(teardown_mutex_);
            proxy_started_ = true;
        }

        auto page = browser_driver_->launch(BrowserLaunchOptions{
            .headless = options.headless,
            .proxy = endpoint,
            .viewport_width = options.capture_window_x,
            .viewport_height = options.capture_window_y,
            .ignore_https_errors = true,
        });
        if (!page) {
            throw std::runtime_error("browser driver returned no page");
        }
        user_agent_ = page->user_agent();
        {
            std::lock_guard<std::mutex> lock(teardown_mutex_);
            page_ = std::move(page);
        }
    } catch (const std::exception& e) {
        setup_error_ = std::format("Capture setup failed for {}: {}", capture_.url(), e.what());
        capture_.add_log("Capture setup failed", true, e.what(), ErrorCategory::SETUP_ERROR);
        utils::log::error(setup_error_);
        {
            std::lock_guard<std::mutex> lock(teardown_mutex_);
            release_resources_locked();
        }
        ingest_queue_->shutdown();
        return false;
    }
    return true;
}

void CaptureController::teardown() {
    std::lock_guard<std::mutex> lock(teardown_mutex_);
    const CaptureState current = capture_.state();
    if (current == CaptureState::TEARDOWN || is_terminal(current)) {
        return;
    }
    capture_.set_state(CaptureState::TEARDOWN);
    capture_.add_log("Closing browser and proxy server.");
    release_resources_locked();
}

void CaptureController::release_resources_locked() {
    if (resources_released_ || (!page_ && !proxy_started_)) {
        return;
    }
    resources_released_ = true;

    // The page object itself stays alive: a step may still be inside it.
    if (page_) {
        try {
            page_->close();
        } catch (const std::exception& e) {
            capture_.add_log("Closing browser failed", true, e.what());
        }
    }
    if (proxy_started_) {
        try {
            proxy_->stop();
        } catch (const std::exception& e) {
            capture_.add_log("Stopping proxy failed", true, e.what());
        }
    }
    release_count_.fetch_add(1, std::memory_order_relaxed);
}

// ============================================================================
// Step pipeline
// ============================================================================

void CaptureController::run_steps(std::vector<std::unique_ptr<ICaptureStep>>& steps) {
    StepContext ctx{
        .page = *page_,
        .url = capture_.url(),
        .options = capture_.options(),
        .emit_generated = [this](GeneratedExchange exchange) {
            capture_.add_generated_exchange(std::move(exchange));
        },
    };

    const size_t total = steps.size();
    for (size_t i = 0; i < total; ++i) {
        ICaptureStep& step = *steps[i];
        const std::string label = std::format("STEP [{}/{}]: {}", i + 1, total, step.name());

        // Budget breaches from data delivered so far must be seen before a step starts
        ingest_queue_->flush();
        if (capture_.state() != CaptureState::CAPTURE) {
            capture_.add_log(std::format("Capture ended early (max size reached): {} of {} steps skipped",
                                         total - i, total), true);
            break;
        }

        capture_.add_log(label);
        utils::Timer timer;
        try {
            step.run(ctx);
        } catch (const std::exception& e) {
            if (capture_.state() == CaptureState::CAPTURE) {
                capture_.add_log(label + " - failed", true, e.what(), ErrorCategory::STEP_ERROR);
            } else {
                capture_.add_log(label + " - ended due to max size reached", true);
            }
            continue;
        }

        const auto elapsed = timer.elapsed_ms();
        if (elapsed > step.timeout()) {
            capture_.add_log(std::format("{} - timed out after {} ms (limit {} ms)",
                                         label, elapsed.count(), step.timeout().count()),
                             true, {}, ErrorCategory::STEP_ERROR);
        }
    }
}

nlohmann::json CaptureController::build_provenance_info(const std::string& capture_start,
                                                        const std::string& capture_end) const {
    nlohmann::json info = {
        {"url", capture_.url()},
        {"software", kSoftwareName},
        {"version", kSoftwareVersion},
        {"captureStart", capture_start},
        {"captureEnd", capture_end},
        {"exchanges", capture_.exchanges().size()},
        {"generatedExchanges", capture_.generated_exchanges().size()},
        {"totalSize", capture_.total_size()},
        {"budgetExceeded", capture_.budget_exceeded()},
        {"options", options_to_json(capture_.options())},
    };
    if (!user_agent_.empty()) {
        info["userAgent"] = user_agent_;
    }
    return info;
}

} // namespace webcapture
