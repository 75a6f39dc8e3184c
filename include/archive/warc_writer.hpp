#pragma once

#include "archive/warc_record.hpp"
#include "core/error.hpp"

#include <string>
#include <string_view>

namespace webcapture {

/**
 * @brief Accumulates WARC records into one in-memory file
 *
 * Every record gets a WARC-Record-ID (unless one is set) and a
 * WARC-Block-Digest. With gzip enabled each record becomes its own gzip
 * member, so the output is a valid .warc.gz.
 */
class WarcWriter {
public:
    explicit WarcWriter(bool gzip = false) : gzip_(gzip) {}

    /**
     * @brief Write a warcinfo record describing the producing software
     * @return record id
     */
    Result<std::string> write_warcinfo(std::string_view filename,
                                       std::string_view software,
                                       std::string_view date);

    /**
     * @brief Append one record
     * @return record id, or ENCODE_ERROR when a field value cannot be
     *         represented on a single header line or compression fails
     */
    Result<std::string> write(WarcRecord record);

    [[nodiscard]] const std::string& data() const { return data_; }
    [[nodiscard]] size_t record_count() const { return record_count_; }

    /// Move the accumulated bytes out
    [[nodiscard]] std::string release() { return std::move(data_); }

private:
    bool gzip_;
    std::string data_;
    size_t record_count_ = 0;
};

} // namespace webcapture
