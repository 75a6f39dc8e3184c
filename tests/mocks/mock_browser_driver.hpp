#pragma once

#include "capture/capture.hpp"
#include "capture/capture_controller.hpp"
#include "capture/ibrowser_driver.hpp"
#include "capture/ingest_queue.hpp"
#include "mocks/mock_proxy_transport.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace webcapture::testing {

/// Minimal PNG signature plus filler; enough for a non-empty image payload
inline const std::string kFakePng = std::string("\x89PNG\r\n\x1a\n", 8) + std::string(64, '\x01');

/**
 * @brief Scripted browser behavior shared between a test and its mocks
 *
 * Operation names: "navigate", "behaviors", "auto_scroll", "screenshot",
 * "network_idle".
 */
struct MockBrowserState {
    std::shared_ptr<MockProxyState> proxy;

    // Traffic pushed through the proxy during navigate() / wait_for_network_idle()
    std::vector<ChunkEvent> navigation_traffic;
    std::vector<ChunkEvent> network_idle_traffic;

    std::string screenshot_png = kFakePng;
    std::string user_agent = "MockBrowser/1.0";
    bool fail_launch = false;
    std::set<std::string> failing_operations;
    std::chrono::milliseconds navigate_delay{0};

    // Run inside launch() / navigate(), i.e. while the capture is in SETUP / CAPTURE
    std::function<void()> on_launch;
    std::function<void()> on_navigate;

    std::mutex mutex;
    std::vector<std::string> calls;
    std::optional<BrowserLaunchOptions> launch_options;
    std::optional<BehaviorsConfig> behaviors_config;
    std::string navigated_url;
    std::atomic<int> launch_count{0};
    std::atomic<int> close_count{0};

    [[nodiscard]] std::vector<std::string> recorded_calls() {
        std::lock_guard<std::mutex> lock(mutex);
        return calls;
    }
};

class MockBrowserPage : public IBrowserPage {
public:
    explicit MockBrowserPage(std::shared_ptr<MockBrowserState> state)
        : state_(std::move(state)) {}

    void navigate(const std::string& url, LoadState /*wait_until*/,
                  std::chrono::milliseconds /*timeout*/) override {
        enter("navigate");
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->navigated_url = url;
        }
        if (state_->on_navigate) {
            state_->on_navigate();
        }
        if (state_->navigate_delay.count() > 0) {
            std::this_thread::sleep_for(state_->navigate_delay);
        }
        replay(state_->navigation_traffic);
    }

    void run_behaviors(const BehaviorsConfig& config,
                       std::chrono::milliseconds /*timeout*/) override {
        enter("behaviors");
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->behaviors_config = config;
    }

    void auto_scroll(std::chrono::milliseconds /*timeout*/) override {
        enter("auto_scroll");
    }

    [[nodiscard]] std::string screenshot_full_page(std::chrono::milliseconds /*timeout*/) override {
        enter("screenshot");
        return state_->screenshot_png;
    }

    void wait_for_network_idle(std::chrono::milliseconds /*timeout*/) override {
        enter("network_idle");
        replay(state_->network_idle_traffic);
    }

    [[nodiscard]] std::string user_agent() const override { return state_->user_agent; }

    void close() override {
        closed_ = true;
        state_->close_count.fetch_add(1);
    }

private:
    void enter(const std::string& operation) {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->calls.push_back(operation);
        }
        if (closed_) {
            throw std::runtime_error(operation + ": page closed");
        }
        if (state_->failing_operations.contains(operation)) {
            throw std::runtime_error(operation + ": simulated failure");
        }
    }

    void replay(const std::vector<ChunkEvent>& traffic) {
        for (const auto& event : traffic) {
            state_->proxy->deliver(event.session_id, event.direction, event.bytes);
        }
    }

    std::shared_ptr<MockBrowserState> state_;
    std::atomic<bool> closed_{false};
};

class MockBrowserDriver : public IBrowserDriver {
public:
    explicit MockBrowserDriver(std::shared_ptr<MockBrowserState> state)
        : state_(std::move(state)) {}

    [[nodiscard]] std::unique_ptr<IBrowserPage> launch(const BrowserLaunchOptions& options) override {
        state_->launch_count.fetch_add(1);
        if (state_->on_launch) {
            state_->on_launch();
        }
        if (state_->fail_launch) {
            throw std::runtime_error("browser executable not found");
        }
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->launch_options = options;
        }
        return std::make_unique<MockBrowserPage>(state_);
    }

private:
    std::shared_ptr<MockBrowserState> state_;
};

// ============================================================================
// Traffic helpers
// ============================================================================

inline std::string make_request(const std::string& host, const std::string& path) {
    return "GET " + path + " HTTP/1.1\r\nHost: " + host + "\r\nUser-Agent: MockBrowser/1.0\r\n\r\n";
}

inline std::string make_response(const std::string& body,
                                  const std::string& content_type = "text/html") {
    return "HTTP/1.1 200 OK\r\nContent-Type: " + content_type +
           "\r\nContent-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

/**
 * @brief Everything a controller test needs, wired together
 */
struct MockHarness {
    std::shared_ptr<MockProxyState> proxy = std::make_shared<MockProxyState>();
    std::shared_ptr<MockBrowserState> browser = [this] {
        auto state = std::make_shared<MockBrowserState>();
        state->proxy = proxy;
        return state;
    }();

    [[nodiscard]] std::unique_ptr<IBrowserDriver> driver() const {
        return std::make_unique<MockBrowserDriver>(browser);
    }

    [[nodiscard]] std::unique_ptr<IProxyTransport> transport() const {
        return std::make_unique<MockProxyTransport>(proxy);
    }
};

/// Page + stylesheet on two connections, as a browser would load example.com
inline std::vector<ChunkEvent> example_com_traffic(size_t page_body_size = 1256) {
    return {
        {.session_id = "sess-1", .direction = Direction::REQUEST,
         .bytes = make_request("example.com", "/")},
        {.session_id = "sess-1", .direction = Direction::RESPONSE,
         .bytes = make_response(std::string(page_body_size, 'x'))},
        {.session_id = "sess-2", .direction = Direction::REQUEST,
         .bytes = make_request("example.com", "/style.css")},
        {.session_id = "sess-2", .direction = Direction::RESPONSE,
         .bytes = make_response("body { margin: 0; }", "text/css")},
    };
}

/// Outcome of one capture driven entirely by mocks
struct MockCaptureRun {
    std::unique_ptr<Capture> capture;
    Result<CaptureState> result;
    uint32_t release_count = 0;
};

/**
 * @brief Create a capture for url and run it against the harness
 *
 * The controller is destroyed before returning; the capture outlives it.
 */
inline MockCaptureRun run_mock_capture(const MockHarness& harness, const std::string& url,
                                       CaptureOptions options) {
    MockCaptureRun run;
    auto created = Capture::create(url, std::move(options));
    if (created.is_error()) {
        run.result = Result<CaptureState>::error(created.error_category(), created.error_message());
        return run;
    }
    run.capture = std::move(created.value());

    CaptureController controller(*run.capture, harness.driver(), harness.transport());
    run.result = controller.capture();
    run.release_count = controller.release_count();
    return run;
}

} // namespace webcapture::testing
