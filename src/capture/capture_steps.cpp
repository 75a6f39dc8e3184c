#include "capture/capture_steps.hpp"
#include "core/utils.hpp"

#include <stdexcept>

namespace webcapture {

void InitialLoadStep::run(StepContext& ctx) {
    ctx.page.navigate(ctx.url, LoadState::LOAD, timeout_);
}

void BrowserBehaviorsStep::run(StepContext& ctx) {
    ctx.page.run_behaviors(config_, config_.timeout);
}

void AutoScrollStep::run(StepContext& ctx) {
    ctx.page.auto_scroll(timeout_);
}

void ScreenshotStep::run(StepContext& ctx) {
    std::string png = ctx.page.screenshot_full_page(timeout_);
    if (png.empty()) {
        throw std::runtime_error("screenshot returned no image data");
    }

    HttpMessage response;
    response.status_code = 200;
    response.status_message = "OK";
    response.headers = {
        {"Content-Type", "image/png"},
        {"Content-Length", std::to_string(png.size())},
    };
    response.body = std::move(png);

    GeneratedExchange exchange;
    exchange.timestamp = utils::now_ms();
    exchange.parsed_response = std::move(response);
    exchange.url = std::string(kScreenshotUrl);
    exchange.description = std::string(kDescription);
    exchange.is_entry_point = true;

    ctx.emit_generated(std::move(exchange));
}

void NetworkIdleStep::run(StepContext& ctx) {
    ctx.page.wait_for_network_idle(timeout_);
}

std::vector<std::unique_ptr<ICaptureStep>> build_capture_steps(const CaptureOptions& options) {
    std::vector<std::unique_ptr<ICaptureStep>> steps;

    steps.push_back(std::make_unique<InitialLoadStep>(options.load_timeout));

    if (options.runs_behaviors()) {
        steps.push_back(std::make_unique<BrowserBehaviorsStep>(BehaviorsConfig{
            .autofetch = options.grab_secondary_resources,
            .autoplay = options.auto_play_media,
            .site_specific = options.run_site_specific_behaviors,
            .timeout = options.behaviors_timeout,
        }));
    }

    if (options.auto_scroll) {
        steps.push_back(std::make_unique<AutoScrollStep>(options.auto_scroll_timeout));
    }

    if (options.screenshot) {
        steps.push_back(std::make_unique<ScreenshotStep>(options.screenshot_timeout));
    }

    // Always last
    steps.push_back(std::make_unique<NetworkIdleStep>(options.network_idle_timeout));

    return steps;
}

} // namespace webcapture
