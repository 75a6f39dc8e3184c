#pragma once

#include <string>
#include <string_view>

namespace webcapture::digest {

/**
 * @brief SHA-256 of data as lowercase hex (64 chars)
 * @throws std::runtime_error if the OpenSSL digest context cannot be created
 */
[[nodiscard]] std::string sha256_hex(std::string_view data);

/// "sha256:<hex>" form used by WARC digests and WACZ resource hashes
[[nodiscard]] inline std::string sha256_label(std::string_view data) {
    return "sha256:" + sha256_hex(data);
}

} // namespace webcapture::digest
