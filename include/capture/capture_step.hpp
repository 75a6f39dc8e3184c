#pragma once

#include "capture/exchange.hpp"
#include "capture/ibrowser_driver.hpp"
#include "config/capture_options.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <string_view>

namespace webcapture {

/**
 * @brief Everything a step may touch
 *
 * The page is owned by the controller for the duration of the capture;
 * steps borrow it. Synthesized exchanges go through emit_generated.
 */
struct StepContext {
    IBrowserPage& page;
    const std::string& url;
    const CaptureOptions& options;
    std::function<void(GeneratedExchange)> emit_generated;
};

/**
 * @brief Abstract capture step interface
 *
 * Steps run strictly one after another. A step signals failure by
 * throwing; the controller logs it and moves on to the next step.
 */
class ICaptureStep {
public:
    virtual ~ICaptureStep() = default;

    virtual void run(StepContext& ctx) = 0;

    /// Human-readable step name for logging
    [[nodiscard]] virtual std::string_view name() const = 0;

    /// Time budget; exceeding it marks the step as failed
    [[nodiscard]] virtual std::chrono::milliseconds timeout() const = 0;
};

} // namespace webcapture
