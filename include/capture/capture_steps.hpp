#pragma once

#include "capture/capture_step.hpp"

#include <memory>
#include <vector>

namespace webcapture {

// ============================================================================
// Concrete steps
// ============================================================================

/// Navigate to the capture URL and wait for the load event
class InitialLoadStep final : public ICaptureStep {
public:
    explicit InitialLoadStep(std::chrono::milliseconds timeout) : timeout_(timeout) {}
    void run(StepContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "initial load"; }
    [[nodiscard]] std::chrono::milliseconds timeout() const override { return timeout_; }

private:
    std::chrono::milliseconds timeout_;
};

/// In-page behaviors: autofetch, autoplay, site-specific scripts
class BrowserBehaviorsStep final : public ICaptureStep {
public:
    explicit BrowserBehaviorsStep(BehaviorsConfig config) : config_(config) {}
    void run(StepContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "browser scripts"; }
    [[nodiscard]] std::chrono::milliseconds timeout() const override { return config_.timeout; }

private:
    BehaviorsConfig config_;
};

class AutoScrollStep final : public ICaptureStep {
public:
    explicit AutoScrollStep(std::chrono::milliseconds timeout) : timeout_(timeout) {}
    void run(StepContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "auto-scroll"; }
    [[nodiscard]] std::chrono::milliseconds timeout() const override { return timeout_; }

private:
    std::chrono::milliseconds timeout_;
};

/**
 * @brief Full-page screenshot as a generated entry-point exchange
 *
 * Emits one GeneratedExchange for kScreenshotUrl whose parsed response
 * is an HTTP/1.1 200 image/png.
 */
class ScreenshotStep final : public ICaptureStep {
public:
    static constexpr std::string_view kScreenshotUrl = "file:///screenshot.png";
    static constexpr std::string_view kDescription = "Capture Time Screenshot";

    explicit ScreenshotStep(std::chrono::milliseconds timeout) : timeout_(timeout) {}
    void run(StepContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "screenshot"; }
    [[nodiscard]] std::chrono::milliseconds timeout() const override { return timeout_; }

private:
    std::chrono::milliseconds timeout_;
};

class NetworkIdleStep final : public ICaptureStep {
public:
    explicit NetworkIdleStep(std::chrono::milliseconds timeout) : timeout_(timeout) {}
    void run(StepContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "network idle"; }
    [[nodiscard]] std::chrono::milliseconds timeout() const override { return timeout_; }

private:
    std::chrono::milliseconds timeout_;
};

/**
 * @brief Ordered step list for the given options
 *
 * initial load, [browser scripts], [auto-scroll], [screenshot], network idle
 */
[[nodiscard]] std::vector<std::unique_ptr<ICaptureStep>> build_capture_steps(
    const CaptureOptions& options);

} // namespace webcapture
