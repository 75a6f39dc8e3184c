#pragma once

#include "capture/iproxy_transport.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace webcapture {

enum class LoadState {
    LOAD,
    DOM_CONTENT_LOADED,
    NETWORK_IDLE
};

struct BrowserLaunchOptions {
    bool headless = true;
    ProxyEndpoint proxy;
    uint32_t viewport_width = 1600;
    uint32_t viewport_height = 900;
    bool ignore_https_errors = true;
};

/// Flags handed to the in-page behavior script
struct BehaviorsConfig {
    bool autofetch = true;
    bool autoplay = true;
    bool site_specific = true;
    std::chrono::milliseconds timeout{20000};
};

/**
 * @brief A controllable page routed through the capture proxy
 *
 * Operations throw std::exception on failure or when their timeout
 * expires. Implementations must enforce the timeout themselves: the
 * controller only measures a step after it returns, so a call that
 * ignores its timeout stalls the capture until the budget breach or the
 * caller's close(). close() may be called from another thread while an
 * operation is in flight; that operation must then return or throw
 * promptly.
 */
class IBrowserPage {
public:
    virtual ~IBrowserPage() = default;

    virtual void navigate(const std::string& url, LoadState wait_until,
                          std::chrono::milliseconds timeout) = 0;

    virtual void run_behaviors(const BehaviorsConfig& config,
                               std::chrono::milliseconds timeout) = 0;

    virtual void auto_scroll(std::chrono::milliseconds timeout) = 0;

    /// Full-page PNG
    [[nodiscard]] virtual std::string screenshot_full_page(std::chrono::milliseconds timeout) = 0;

    virtual void wait_for_network_idle(std::chrono::milliseconds timeout) = 0;

    [[nodiscard]] virtual std::string user_agent() const = 0;

    /// Close the page and its browser. Idempotent.
    virtual void close() = 0;
};

/**
 * @brief Launches browsers
 */
class IBrowserDriver {
public:
    virtual ~IBrowserDriver() = default;

    /**
     * @throws std::exception when the browser cannot be started
     */
    [[nodiscard]] virtual std::unique_ptr<IBrowserPage> launch(const BrowserLaunchOptions& options) = 0;
};

} // namespace webcapture
