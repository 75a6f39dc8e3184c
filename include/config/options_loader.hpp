#pragma once

#include "config/capture_options.hpp"
#include "core/error.hpp"

#include <string>

namespace webcapture {

/**
 * @brief Loads CaptureOptions from a TOML document
 *
 * Expected layout:
 *
 *   [capture]
 *   headless = true
 *   max_size = 1048576
 *   load_timeout_ms = 20000
 *   ...
 *
 * Unknown tables or keys, wrong value types and out-of-range values are
 * rejected with the offending key in the error message. Missing keys keep
 * their defaults.
 */
class OptionsLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        CaptureOptions options;

        static LoadResult ok(CaptureOptions opts) {
            LoadResult result;
            result.success = true;
            result.options = std::move(opts);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& path);

    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);
};

/**
 * @brief Check that url is an absolute http(s) URL with a host
 * @return normalized URL (lower-case scheme and host, "/" path when empty)
 *         or CONFIGURATION_ERROR
 */
[[nodiscard]] Result<std::string> validate_url(const std::string& url);

} // namespace webcapture
