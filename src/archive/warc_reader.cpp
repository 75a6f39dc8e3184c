#include "archive/warc_reader.hpp"
#include "archive/compression.hpp"
#include "core/utils.hpp"

#include <format>

namespace webcapture::warc {

namespace {

constexpr std::string_view kCrlf = "\r\n";
constexpr std::string_view kRecordEnd = "\r\n\r\n";

Result<std::vector<WarcRecord>> fail(size_t offset, std::string_view what) {
    return Result<std::vector<WarcRecord>>::error(ErrorCategory::DECODE_ERROR,
        std::format("Malformed WARC record at offset {}: {}", offset, what));
}

} // anonymous namespace

Result<std::vector<WarcRecord>> read_all(std::string_view data) {
    std::string inflated;
    if (compression::is_gzip(data)) {
        auto plain = compression::gunzip(data);
        if (!plain) {
            return Result<std::vector<WarcRecord>>::error(ErrorCategory::DECODE_ERROR,
                                                          "Corrupt gzip stream in WARC file");
        }
        inflated = std::move(*plain);
        data = inflated;
    }

    std::vector<WarcRecord> records;
    size_t pos = 0;

    while (pos < data.size()) {
        const size_t record_start = pos;

        const size_t version_end = data.find(kCrlf, pos);
        if (version_end == std::string_view::npos) {
            return fail(record_start, "missing version line");
        }

        WarcRecord record;
        record.version = std::string(data.substr(pos, version_end - pos));
        if (record.version != "WARC/1.1" && record.version != "WARC/1.0") {
            return fail(record_start, std::format("unsupported version '{}'", record.version));
        }
        pos = version_end + kCrlf.size();

        // Named fields up to the blank line
        std::optional<uint64_t> content_length;
        while (true) {
            const size_t line_end = data.find(kCrlf, pos);
            if (line_end == std::string_view::npos) {
                return fail(record_start, "unterminated header block");
            }
            const std::string_view line = data.substr(pos, line_end - pos);
            pos = line_end + kCrlf.size();
            if (line.empty()) {
                break;
            }

            const size_t colon = line.find(':');
            if (colon == std::string_view::npos || colon == 0) {
                return fail(record_start, std::format("invalid field line '{}'", line));
            }
            std::string name(utils::trim(line.substr(0, colon)));
            // Only the single separator space is dropped, so values keep
            // their own leading and trailing whitespace
            std::string_view raw_value = line.substr(colon + 1);
            if (raw_value.starts_with(' ')) {
                raw_value.remove_prefix(1);
            }
            std::string value(raw_value);

            if (utils::iequals(name, "Content-Length")) {
                content_length = utils::try_parse_int<uint64_t>(utils::trim(value));
                if (!content_length) {
                    return fail(record_start, std::format("invalid Content-Length '{}'", value));
                }
            }
            record.fields.emplace_back(std::move(name), std::move(value));
        }

        if (!content_length) {
            return fail(record_start, "missing Content-Length");
        }
        if (*content_length > data.size() - pos) {
            return fail(record_start, "Content-Length exceeds remaining data");
        }
        record.block = std::string(data.substr(pos, *content_length));
        pos += *content_length;

        if (data.substr(pos, kRecordEnd.size()) != kRecordEnd) {
            return fail(record_start, "block not followed by CRLF CRLF");
        }
        pos += kRecordEnd.size();

        records.push_back(std::move(record));
    }

    return Result<std::vector<WarcRecord>>::ok(std::move(records));
}

} // namespace webcapture::warc
