#pragma once

#include "core/error.hpp"
#include "core/utils.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace webcapture {

enum class ZipMethod : uint16_t {
    STORED = 0,
    DEFLATED = 8
};

struct ZipEntry {
    std::string name;
    std::string data;           ///< Uncompressed contents
    ZipMethod method = ZipMethod::DEFLATED;
};

/**
 * @brief Minimal ZIP writer (no ZIP64, no encryption)
 *
 * Entries are written in insertion order: local header + data, then the
 * central directory and end-of-central-directory record.
 */
class ZipWriter {
public:
    explicit ZipWriter(utils::Timestamp modified = utils::now_ms()) : modified_(modified) {}

    /// ENCODE_ERROR on duplicate name or when ZIP64 would be required
    Result<bool> add(std::string name, std::string_view data, ZipMethod method);

    /// Append the central directory and return the archive bytes
    [[nodiscard]] Result<std::string> finish();

    [[nodiscard]] size_t entry_count() const { return central_.size(); }

private:
    struct CentralEntry {
        std::string name;
        ZipMethod method;
        uint32_t crc;
        uint32_t compressed_size;
        uint32_t uncompressed_size;
        uint32_t local_offset;
    };

    utils::Timestamp modified_;
    std::string out_;
    std::vector<CentralEntry> central_;
    bool finished_ = false;
};

/**
 * @brief ZIP reader: central directory walk, stored/deflate, CRC-checked
 */
class ZipReader {
public:
    /// Parse the central directory and extract every entry
    [[nodiscard]] static Result<std::vector<ZipEntry>> read_all(std::string_view data);
};

} // namespace webcapture
