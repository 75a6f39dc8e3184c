#include "archive/zip_archive.hpp"
#include "archive/compression.hpp"

#include <algorithm>
#include <ctime>
#include <format>
#include <limits>
#include <unordered_set>

namespace webcapture {

namespace {

constexpr uint32_t kLocalHeaderSig = 0x04034b50;
constexpr uint32_t kCentralHeaderSig = 0x02014b50;
constexpr uint32_t kEndOfCentralDirSig = 0x06054b50;

constexpr size_t kLocalHeaderSize = 30;
constexpr size_t kCentralHeaderSize = 46;
constexpr size_t kEndOfCentralDirSize = 22;
constexpr size_t kMaxCommentSize = 0xFFFF;

constexpr uint16_t kVersion = 20;           // 2.0: deflate
constexpr uint16_t kFlagUtf8 = 0x0800;
constexpr uint16_t kFlagEncrypted = 0x0001;
constexpr uint64_t kMax32 = std::numeric_limits<uint32_t>::max();
constexpr size_t kMaxEntries = 0xFFFF;

// ============================================================================
// Little-endian helpers
// ============================================================================

void put16(std::string& out, uint16_t v) {
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
}

void put32(std::string& out, uint32_t v) {
    put16(out, static_cast<uint16_t>(v & 0xFFFF));
    put16(out, static_cast<uint16_t>(v >> 16));
}

uint16_t get16(std::string_view data, size_t pos) {
    return static_cast<uint16_t>(static_cast<unsigned char>(data[pos]) |
                                 (static_cast<unsigned char>(data[pos + 1]) << 8));
}

uint32_t get32(std::string_view data, size_t pos) {
    return static_cast<uint32_t>(get16(data, pos)) |
           (static_cast<uint32_t>(get16(data, pos + 2)) << 16);
}

/// MS-DOS date/time pair for a UTC timestamp (clamped to 1980)
std::pair<uint16_t, uint16_t> dos_date_time(utils::Timestamp ts) {
    const std::time_t t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm_buf;
    ::gmtime_r(&t, &tm_buf);
    if (tm_buf.tm_year < 80) {
        return {static_cast<uint16_t>((1 << 5) | 1), 0};
    }
    const auto date = static_cast<uint16_t>(((tm_buf.tm_year - 80) << 9) |
                                            ((tm_buf.tm_mon + 1) << 5) | tm_buf.tm_mday);
    const auto time = static_cast<uint16_t>((tm_buf.tm_hour << 11) | (tm_buf.tm_min << 5) |
                                            (tm_buf.tm_sec / 2));
    return {date, time};
}

template<typename T>
Result<T> zip_error(std::string message) {
    return Result<T>::error(ErrorCategory::DECODE_ERROR, "Invalid ZIP archive: " + message);
}

} // anonymous namespace

// ============================================================================
// ZipWriter
// ============================================================================

Result<bool> ZipWriter::add(std::string name, std::string_view data, ZipMethod method) {
    if (finished_) {
        return Result<bool>::error(ErrorCategory::INTERNAL_ERROR, "ZIP archive already finished");
    }
    if (name.empty() || name.size() > 0xFFFF) {
        return Result<bool>::error(ErrorCategory::ENCODE_ERROR,
                                   std::format("Invalid ZIP entry name '{}'", name));
    }
    const bool duplicate = std::any_of(central_.begin(), central_.end(),
        [&](const CentralEntry& e) { return e.name == name; });
    if (duplicate) {
        return Result<bool>::error(ErrorCategory::ENCODE_ERROR,
                                   std::format("Duplicate ZIP entry '{}'", name));
    }
    if (central_.size() >= kMaxEntries) {
        return Result<bool>::error(ErrorCategory::ENCODE_ERROR,
                                   "Too many ZIP entries (ZIP64 not supported)");
    }

    std::string compressed;
    std::string_view payload = data;
    if (method == ZipMethod::DEFLATED) {
        auto deflated = compression::deflate_raw(data);
        if (!deflated) {
            return Result<bool>::error(ErrorCategory::ENCODE_ERROR,
                                       std::format("Deflate failed for '{}'", name));
        }
        compressed = std::move(*deflated);
        payload = compressed;
    }

    if (data.size() > kMax32 || payload.size() > kMax32 ||
        out_.size() + kLocalHeaderSize + name.size() + payload.size() > kMax32) {
        return Result<bool>::error(ErrorCategory::ENCODE_ERROR,
            std::format("ZIP entry '{}' exceeds 4 GiB limits (ZIP64 not supported)", name));
    }

    const auto [dos_date, dos_time] = dos_date_time(modified_);
    CentralEntry entry{
        .name = std::move(name),
        .method = method,
        .crc = compression::crc32(data),
        .compressed_size = static_cast<uint32_t>(payload.size()),
        .uncompressed_size = static_cast<uint32_t>(data.size()),
        .local_offset = static_cast<uint32_t>(out_.size()),
    };

    put32(out_, kLocalHeaderSig);
    put16(out_, kVersion);
    put16(out_, kFlagUtf8);
    put16(out_, static_cast<uint16_t>(entry.method));
    put16(out_, dos_time);
    put16(out_, dos_date);
    put32(out_, entry.crc);
    put32(out_, entry.compressed_size);
    put32(out_, entry.uncompressed_size);
    put16(out_, static_cast<uint16_t>(entry.name.size()));
    put16(out_, 0);  // extra field length
    out_ += entry.name;
    out_.append(payload.data(), payload.size());

    central_.push_back(std::move(entry));
    return Result<bool>::ok(true);
}

Result<std::string> ZipWriter::finish() {
    if (finished_) {
        return Result<std::string>::error(ErrorCategory::INTERNAL_ERROR,
                                          "ZIP archive already finished");
    }
    finished_ = true;

    const auto [dos_date, dos_time] = dos_date_time(modified_);
    const uint64_t directory_offset = out_.size();

    for (const auto& entry : central_) {
        put32(out_, kCentralHeaderSig);
        put16(out_, kVersion);  // made by
        put16(out_, kVersion);  // needed to extract
        put16(out_, kFlagUtf8);
        put16(out_, static_cast<uint16_t>(entry.method));
        put16(out_, dos_time);
        put16(out_, dos_date);
        put32(out_, entry.crc);
        put32(out_, entry.compressed_size);
        put32(out_, entry.uncompressed_size);
        put16(out_, static_cast<uint16_t>(entry.name.size()));
        put16(out_, 0);  // extra
        put16(out_, 0);  // comment
        put16(out_, 0);  // disk number
        put16(out_, 0);  // internal attributes
        put32(out_, 0);  // external attributes
        put32(out_, entry.local_offset);
        out_ += entry.name;
    }

    const uint64_t directory_size = out_.size() - directory_offset;
    if (directory_offset > kMax32 || directory_size > kMax32) {
        return Result<std::string>::error(ErrorCategory::ENCODE_ERROR,
                                          "ZIP central directory beyond 4 GiB (ZIP64 not supported)");
    }

    put32(out_, kEndOfCentralDirSig);
    put16(out_, 0);
    put16(out_, 0);
    put16(out_, static_cast<uint16_t>(central_.size()));
    put16(out_, static_cast<uint16_t>(central_.size()));
    put32(out_, static_cast<uint32_t>(directory_size));
    put32(out_, static_cast<uint32_t>(directory_offset));
    put16(out_, 0);  // comment length

    return Result<std::string>::ok(std::move(out_));
}

// ============================================================================
// ZipReader
// ============================================================================

Result<std::vector<ZipEntry>> ZipReader::read_all(std::string_view data) {
    using EntriesResult = Result<std::vector<ZipEntry>>;

    if (data.size() < kEndOfCentralDirSize) {
        return zip_error<std::vector<ZipEntry>>("too short");
    }

    // End-of-central-directory: scan backwards over a possible comment
    size_t eocd = std::string_view::npos;
    const size_t scan_floor = data.size() > kEndOfCentralDirSize + kMaxCommentSize
        ? data.size() - kEndOfCentralDirSize - kMaxCommentSize
        : 0;
    for (size_t pos = data.size() - kEndOfCentralDirSize + 1; pos-- > scan_floor;) {
        if (get32(data, pos) == kEndOfCentralDirSig &&
            pos + kEndOfCentralDirSize + get16(data, pos + 20) == data.size()) {
            eocd = pos;
            break;
        }
    }
    if (eocd == std::string_view::npos) {
        return zip_error<std::vector<ZipEntry>>("end of central directory not found");
    }

    const uint16_t entry_count = get16(data, eocd + 10);
    const uint32_t directory_size = get32(data, eocd + 12);
    const uint32_t directory_offset = get32(data, eocd + 16);
    if (get16(data, eocd + 4) != 0 || get16(data, eocd + 6) != 0 ||
        get16(data, eocd + 8) != entry_count) {
        return zip_error<std::vector<ZipEntry>>("multi-disk archives are not supported");
    }
    if (static_cast<uint64_t>(directory_offset) + directory_size > eocd) {
        return zip_error<std::vector<ZipEntry>>("central directory out of bounds");
    }

    std::vector<ZipEntry> entries;
    entries.reserve(entry_count);
    std::unordered_set<std::string> seen;

    size_t pos = directory_offset;
    for (uint16_t i = 0; i < entry_count; ++i) {
        if (pos + kCentralHeaderSize > eocd || get32(data, pos) != kCentralHeaderSig) {
            return zip_error<std::vector<ZipEntry>>(
                std::format("bad central directory header #{}", i));
        }
        const uint16_t flags = get16(data, pos + 8);
        const uint16_t method = get16(data, pos + 10);
        const uint32_t crc = get32(data, pos + 16);
        const uint32_t compressed_size = get32(data, pos + 20);
        const uint32_t uncompressed_size = get32(data, pos + 24);
        const uint16_t name_length = get16(data, pos + 28);
        const uint16_t extra_length = get16(data, pos + 30);
        const uint16_t comment_length = get16(data, pos + 32);
        const uint32_t local_offset = get32(data, pos + 42);

        const size_t name_start = pos + kCentralHeaderSize;
        if (name_start + name_length + extra_length + comment_length > eocd) {
            return zip_error<std::vector<ZipEntry>>(
                std::format("central directory header #{} out of bounds", i));
        }
        std::string name(data.substr(name_start, name_length));
        pos = name_start + name_length + extra_length + comment_length;

        if (flags & kFlagEncrypted) {
            return zip_error<std::vector<ZipEntry>>(std::format("entry '{}' is encrypted", name));
        }
        if (!seen.insert(name).second) {
            return zip_error<std::vector<ZipEntry>>(std::format("duplicate entry '{}'", name));
        }

        // Local header: only its variable-length part is needed
        if (static_cast<uint64_t>(local_offset) + kLocalHeaderSize > directory_offset ||
            get32(data, local_offset) != kLocalHeaderSig) {
            return zip_error<std::vector<ZipEntry>>(
                std::format("bad local header for '{}'", name));
        }
        const uint64_t data_start = static_cast<uint64_t>(local_offset) + kLocalHeaderSize +
                                    get16(data, local_offset + 26) +
                                    get16(data, local_offset + 28);
        if (data_start + compressed_size > directory_offset) {
            return zip_error<std::vector<ZipEntry>>(
                std::format("data for '{}' out of bounds", name));
        }
        const std::string_view payload = data.substr(data_start, compressed_size);

        ZipEntry entry;
        entry.name = std::move(name);
        if (method == static_cast<uint16_t>(ZipMethod::STORED)) {
            entry.method = ZipMethod::STORED;
            entry.data = std::string(payload);
        } else if (method == static_cast<uint16_t>(ZipMethod::DEFLATED)) {
            entry.method = ZipMethod::DEFLATED;
            auto inflated = compression::inflate_raw(payload, uncompressed_size);
            if (!inflated) {
                return zip_error<std::vector<ZipEntry>>(
                    std::format("corrupt deflate data in '{}'", entry.name));
            }
            entry.data = std::move(*inflated);
        } else {
            return zip_error<std::vector<ZipEntry>>(
                std::format("unsupported compression method {} for '{}'", method, entry.name));
        }

        if (entry.data.size() != uncompressed_size) {
            return zip_error<std::vector<ZipEntry>>(
                std::format("size mismatch for '{}'", entry.name));
        }
        if (compression::crc32(entry.data) != crc) {
            return zip_error<std::vector<ZipEntry>>(
                std::format("CRC mismatch for '{}'", entry.name));
        }
        entries.push_back(std::move(entry));
    }

    return EntriesResult::ok(std::move(entries));
}

} // namespace webcapture
