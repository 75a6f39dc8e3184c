#pragma once

#include "core/utils.hpp"
#include "http/http_message.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace webcapture {

enum class Direction {
    REQUEST,
    RESPONSE
};

[[nodiscard]] inline constexpr std::string_view direction_name(Direction direction) {
    return direction == Direction::REQUEST ? "request" : "response";
}

/**
 * @brief One HTTP request paired with its response
 *
 * Intercepted exchanges carry raw wire bytes; exchanges synthesized
 * in-process carry parsed messages instead.
 */
struct Exchange {
    std::string id;                 ///< Proxy session id (reused across pairs on one connection)
    utils::Timestamp timestamp;     ///< Creation time, millisecond precision
    std::string request_raw;
    std::string response_raw;

    std::optional<HttpMessage> parsed_request;
    std::optional<HttpMessage> parsed_response;

    [[nodiscard]] bool has_response() const { return !response_raw.empty(); }

    [[nodiscard]] std::string& raw(Direction direction) {
        return direction == Direction::REQUEST ? request_raw : response_raw;
    }

    [[nodiscard]] const std::string& raw(Direction direction) const {
        return direction == Direction::REQUEST ? request_raw : response_raw;
    }

    /// Absolute URL of the request, derived from the raw request head
    [[nodiscard]] std::optional<std::string> request_url() const {
        if (parsed_request) {
            return http::request_url(http::serialize(*parsed_request));
        }
        return http::request_url(request_raw);
    }

    bool operator==(const Exchange&) const = default;
};

/**
 * @brief Exchange synthesized by the controller (e.g. a screenshot)
 *
 * Entry points are listed as navigable pages in the archive.
 */
struct GeneratedExchange : Exchange {
    std::string url;
    std::string description;
    bool is_entry_point = false;

    bool operator==(const GeneratedExchange&) const = default;
};

} // namespace webcapture
