#include "archive/warc_writer.hpp"
#include "archive/compression.hpp"
#include "core/digest.hpp"

#include <format>

namespace webcapture {

namespace {

bool is_single_line(std::string_view value) {
    return value.find_first_of("\r\n") == std::string_view::npos;
}

} // anonymous namespace

Result<std::string> WarcWriter::write_warcinfo(std::string_view filename,
                                               std::string_view software,
                                               std::string_view date) {
    WarcRecord record;
    record.fields = {
        {"WARC-Type", "warcinfo"},
        {"WARC-Date", std::string(date)},
        {"WARC-Filename", std::string(filename)},
        {"Content-Type", "application/warc-fields"},
    };
    record.block = std::format("software: {}\r\nformat: WARC File Format 1.1\r\n", software);
    return write(std::move(record));
}

Result<std::string> WarcWriter::write(WarcRecord record) {
    for (const auto& [name, value] : record.fields) {
        if (!is_single_line(name) || !is_single_line(value) ||
            name.find(':') != std::string::npos) {
            return Result<std::string>::error(ErrorCategory::ENCODE_ERROR,
                std::format("WARC field '{}' is not representable on one line", name));
        }
    }

    std::string id;
    if (auto existing = record.field("WARC-Record-ID")) {
        id = std::move(*existing);
    } else {
        id = warc::new_record_id();
        // Record-ID conventionally follows WARC-Type
        record.fields.insert(record.fields.empty() ? record.fields.end()
                                                   : record.fields.begin() + 1,
                             std::pair<std::string, std::string>("WARC-Record-ID", id));
    }
    if (!record.field("WARC-Block-Digest")) {
        record.fields.emplace_back("WARC-Block-Digest", digest::sha256_label(record.block));
    }

    std::string bytes = warc::serialize(record);
    if (gzip_) {
        auto member = compression::gzip(bytes);
        if (!member) {
            return Result<std::string>::error(ErrorCategory::ENCODE_ERROR,
                                              "gzip compression of WARC record failed");
        }
        data_ += *member;
    } else {
        data_ += bytes;
    }
    ++record_count_;
    return Result<std::string>::ok(std::move(id));
}

} // namespace webcapture
