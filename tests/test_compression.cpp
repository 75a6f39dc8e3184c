#include <catch2/catch_test_macros.hpp>
#include "archive/compression.hpp"

#include <string>

using namespace webcapture;

TEST_CASE("Compression: crc32 known value", "[compression]") {
    CHECK(compression::crc32("") == 0u);
    CHECK(compression::crc32("123456789") == 0xCBF43926u);
}

TEST_CASE("Compression: raw deflate shrinks repetitive data and inflates back", "[compression]") {
    const std::string data(10000, 'a');
    const auto deflated = compression::deflate_raw(data);
    REQUIRE(deflated.has_value());
    CHECK(deflated->size() < data.size() / 10);
    // Raw stream: no zlib or gzip header
    CHECK_FALSE(compression::is_gzip(*deflated));

    const auto inflated = compression::inflate_raw(*deflated, data.size());
    REQUIRE(inflated.has_value());
    CHECK(*inflated == data);
}

TEST_CASE("Compression: truncated deflate stream is rejected", "[compression]") {
    std::string data;
    for (int i = 0; i < 2000; ++i) data += std::to_string(i * 7919);
    auto deflated = compression::deflate_raw(data);
    REQUIRE(deflated.has_value());
    deflated->resize(deflated->size() / 2);
    CHECK_FALSE(compression::inflate_raw(*deflated).has_value());
}

TEST_CASE("Compression: concatenated gzip members decompress as one stream", "[compression]") {
    const auto first = compression::gzip("WARC/1.1\r\n");
    const auto second = compression::gzip("second member");
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(compression::is_gzip(*first));

    const auto joined = compression::gunzip(*first + *second);
    REQUIRE(joined.has_value());
    CHECK(*joined == "WARC/1.1\r\nsecond member");

    CHECK_FALSE(compression::gunzip("\x1f\x8bgarbage").has_value());
}
