#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace webcapture::compression {

/// CRC-32 (ZIP / gzip polynomial)
[[nodiscard]] uint32_t crc32(std::string_view data);

/// Raw deflate stream (no zlib/gzip wrapper), as stored in ZIP method 8
[[nodiscard]] std::optional<std::string> deflate_raw(std::string_view data);

/**
 * @brief Inflate a raw deflate stream
 * @param size_hint expected output size, used to size the buffer up front
 * @return nullopt on corrupt or truncated input
 */
[[nodiscard]] std::optional<std::string> inflate_raw(std::string_view data, size_t size_hint = 0);

/// One gzip member
[[nodiscard]] std::optional<std::string> gzip(std::string_view data);

/// Decompress a sequence of concatenated gzip members
[[nodiscard]] std::optional<std::string> gunzip(std::string_view data);

/// True if data starts with the gzip magic bytes
[[nodiscard]] inline bool is_gzip(std::string_view data) {
    return data.size() >= 2 &&
           static_cast<unsigned char>(data[0]) == 0x1f &&
           static_cast<unsigned char>(data[1]) == 0x8b;
}

} // namespace webcapture::compression
