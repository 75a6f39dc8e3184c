#pragma once

#include "archive/warc_record.hpp"
#include "core/error.hpp"

#include <string_view>
#include <vector>

namespace webcapture::warc {

/**
 * @brief Parse a complete WARC file (plain or concatenated gzip members)
 *
 * Validation:
 * - version line must be WARC/1.0 or WARC/1.1
 * - every field line must contain ':'
 * - Content-Length must be present, numeric and fit the remaining bytes
 * - each block must be followed by CRLF CRLF
 *
 * @return records in file order, or DECODE_ERROR naming the offset of
 *         the offending record
 */
[[nodiscard]] Result<std::vector<WarcRecord>> read_all(std::string_view data);

} // namespace webcapture::warc
