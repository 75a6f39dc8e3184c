#pragma once

#include "http/http_message.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace webcapture {

// WARC named fields share the HTTP header list shape (ordered, original case)
using WarcFields = HeaderList;

/**
 * @brief One WARC record: version line, named fields, block
 *
 * Content-Length is derived from the block when serializing and is not
 * kept in `fields` by the writer; the reader keeps every field it saw.
 */
struct WarcRecord {
    std::string version = "WARC/1.1";
    WarcFields fields;
    std::string block;

    /// First field with the given name (case-insensitive)
    [[nodiscard]] std::optional<std::string> field(std::string_view name) const;

    [[nodiscard]] std::string type() const { return field("WARC-Type").value_or(""); }
    [[nodiscard]] std::string record_id() const { return field("WARC-Record-ID").value_or(""); }
};

namespace warc {

inline constexpr std::string_view kVersion = "WARC/1.1";
inline constexpr std::string_view kHttpRequestType = "application/http;msgtype=request";
inline constexpr std::string_view kHttpResponseType = "application/http;msgtype=response";

/// "<urn:uuid:...>"
[[nodiscard]] std::string new_record_id();

/// Wire form: version, fields, Content-Length, blank line, block, CRLF CRLF
[[nodiscard]] std::string serialize(const WarcRecord& record);

} // namespace warc

} // namespace webcapture
