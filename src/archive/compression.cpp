#include "archive/compression.hpp"

#include <zlib.h>

#include <algorithm>
#include <limits>

namespace webcapture::compression {

namespace {

constexpr size_t kChunkSize = 64 * 1024;
constexpr int kRawWindowBits = -15;
// windowBits=15+16 for gzip format
constexpr int kGzipWindowBits = 15 + 16;

std::optional<std::string> run_deflate(std::string_view data, int window_bits) {
    z_stream zs{};
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                     window_bits, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return std::nullopt;
    }

    std::string out;
    const auto* next = reinterpret_cast<const Bytef*>(data.data());
    size_t remaining = data.size();
    int ret = Z_OK;

    do {
        const size_t take = std::min<size_t>(remaining, std::numeric_limits<uInt>::max());
        zs.next_in = const_cast<Bytef*>(next);
        zs.avail_in = static_cast<uInt>(take);
        next += take;
        remaining -= take;
        const int flush = remaining == 0 ? Z_FINISH : Z_NO_FLUSH;

        do {
            const size_t offset = out.size();
            out.resize(offset + kChunkSize);
            zs.next_out = reinterpret_cast<Bytef*>(out.data() + offset);
            zs.avail_out = static_cast<uInt>(kChunkSize);
            ret = deflate(&zs, flush);
            out.resize(offset + (kChunkSize - zs.avail_out));
            if (ret == Z_STREAM_ERROR) {
                deflateEnd(&zs);
                return std::nullopt;
            }
        } while (zs.avail_out == 0);
    } while (remaining > 0);

    deflateEnd(&zs);
    if (ret != Z_STREAM_END) {
        return std::nullopt;
    }
    return out;
}

} // anonymous namespace

uint32_t crc32(std::string_view data) {
    uLong crc = ::crc32(0L, Z_NULL, 0);
    const auto* next = reinterpret_cast<const Bytef*>(data.data());
    size_t remaining = data.size();
    while (remaining > 0) {
        const size_t take = std::min<size_t>(remaining, std::numeric_limits<uInt>::max());
        crc = ::crc32(crc, next, static_cast<uInt>(take));
        next += take;
        remaining -= take;
    }
    return static_cast<uint32_t>(crc);
}

std::optional<std::string> deflate_raw(std::string_view data) {
    return run_deflate(data, kRawWindowBits);
}

std::optional<std::string> gzip(std::string_view data) {
    return run_deflate(data, kGzipWindowBits);
}

std::optional<std::string> inflate_raw(std::string_view data, size_t size_hint) {
    if (data.size() > std::numeric_limits<uInt>::max()) {
        return std::nullopt;
    }

    z_stream zs{};
    if (inflateInit2(&zs, kRawWindowBits) != Z_OK) {
        return std::nullopt;
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());

    std::string out;
    out.reserve(size_hint);
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        const size_t offset = out.size();
        out.resize(offset + kChunkSize);
        zs.next_out = reinterpret_cast<Bytef*>(out.data() + offset);
        zs.avail_out = static_cast<uInt>(kChunkSize);
        ret = inflate(&zs, Z_NO_FLUSH);
        out.resize(offset + (kChunkSize - zs.avail_out));

        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&zs);
            return std::nullopt;
        }
        // Input exhausted without reaching the end of the stream
        if (ret == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
            inflateEnd(&zs);
            return std::nullopt;
        }
    }

    inflateEnd(&zs);
    return out;
}

std::optional<std::string> gunzip(std::string_view data) {
    if (data.size() > std::numeric_limits<uInt>::max()) {
        return std::nullopt;
    }

    z_stream zs{};
    if (inflateInit2(&zs, kGzipWindowBits) != Z_OK) {
        return std::nullopt;
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());

    std::string out;
    while (true) {
        const size_t offset = out.size();
        out.resize(offset + kChunkSize);
        zs.next_out = reinterpret_cast<Bytef*>(out.data() + offset);
        zs.avail_out = static_cast<uInt>(kChunkSize);
        const int ret = inflate(&zs, Z_NO_FLUSH);
        out.resize(offset + (kChunkSize - zs.avail_out));

        if (ret == Z_STREAM_END) {
            if (zs.avail_in == 0) {
                break;
            }
            // Next member
            if (inflateReset(&zs) != Z_OK) {
                inflateEnd(&zs);
                return std::nullopt;
            }
            continue;
        }
        if (ret != Z_OK || (zs.avail_in == 0 && zs.avail_out != 0)) {
            inflateEnd(&zs);
            return std::nullopt;
        }
    }

    inflateEnd(&zs);
    return out;
}

} // namespace webcapture::compression
