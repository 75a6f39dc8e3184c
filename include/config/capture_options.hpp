#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace webcapture {

// ============================================================================
// CaptureOptions - every recognized option with its type and default
// ============================================================================

struct CaptureOptions {
    // Browser
    bool headless = true;
    uint32_t capture_window_x = 1600;
    uint32_t capture_window_y = 900;

    // Proxy
    std::string proxy_host = "localhost";
    uint16_t proxy_port = 9000;
    bool proxy_verbose = false;

    // Per-step timeouts
    std::chrono::milliseconds load_timeout{20000};
    std::chrono::milliseconds network_idle_timeout{20000};
    std::chrono::milliseconds behaviors_timeout{20000};
    std::chrono::milliseconds auto_scroll_timeout{10000};
    std::chrono::milliseconds screenshot_timeout{10000};

    // Size budget (bytes)
    uint64_t max_size = 200ULL * 1024 * 1024;

    // Pipeline toggles
    bool grab_secondary_resources = true;
    bool auto_play_media = true;
    bool run_site_specific_behaviors = true;
    bool auto_scroll = true;
    bool screenshot = true;

    // Export
    bool include_raw = false;
    bool provenance_summary = true;

    bool verbose = false;

    [[nodiscard]] bool runs_behaviors() const {
        return grab_secondary_resources || auto_play_media || run_site_specific_behaviors;
    }

    bool operator==(const CaptureOptions&) const = default;
};

/// Options as a flat JSON object keyed like the TOML file
[[nodiscard]] nlohmann::json options_to_json(const CaptureOptions& options);

} // namespace webcapture
