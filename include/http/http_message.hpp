#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace webcapture {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Structured view of one HTTP/1.x message
 *
 * Requests have a non-empty method; responses have a status code.
 * Headers keep wire order and original case.
 */
struct HttpMessage {
    std::string method;
    std::string target;

    int status_code = 0;
    std::string status_message;

    int version_major = 1;
    int version_minor = 1;

    HeaderList headers;
    std::string body;

    [[nodiscard]] bool is_request() const { return !method.empty(); }

    /// First header with the given name (case-insensitive)
    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;

    bool operator==(const HttpMessage&) const = default;
};

namespace http {

/// Serialize to wire form: start line, headers, blank line, body.
[[nodiscard]] std::string serialize(const HttpMessage& message);

/**
 * @brief Parse a complete request (head + everything after it as body)
 * @return nullopt if the head is incomplete or malformed
 */
[[nodiscard]] std::optional<HttpMessage> parse_request(std::string_view raw);

/// Response counterpart of parse_request()
[[nodiscard]] std::optional<HttpMessage> parse_response(std::string_view raw);

/**
 * @brief Absolute URL a raw request was addressed to
 *
 * Absolute-form targets are returned as-is. Origin-form targets are
 * combined with the Host header under @p default_scheme (intercepted
 * TLS traffic arrives in origin-form). CONNECT yields "scheme://authority/".
 */
[[nodiscard]] std::optional<std::string> request_url(std::string_view raw_request,
                                                     std::string_view default_scheme = "https");

} // namespace http

} // namespace webcapture
