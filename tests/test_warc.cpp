#include <catch2/catch_test_macros.hpp>
#include "archive/warc_reader.hpp"
#include "archive/warc_writer.hpp"
#include "core/digest.hpp"

#include <string>

using namespace webcapture;

namespace {

WarcRecord response_record(std::string block) {
    WarcRecord record;
    record.fields = {
        {"WARC-Type", "response"},
        {"WARC-Date", "2026-10-18T09:41:07.123Z"},
        {"WARC-Target-URI", "https://example.com/"},
        {"Content-Type", std::string(warc::kHttpResponseType)},
    };
    record.block = std::move(block);
    return record;
}

} // anonymous namespace

TEST_CASE("WARC: record envelope layout", "[warc]") {
    WarcRecord record = response_record("HTTP/1.1 200 OK\r\n\r\nhi");
    const std::string wire = warc::serialize(record);

    CHECK(wire.starts_with("WARC/1.1\r\nWARC-Type: response\r\n"));
    CHECK(wire.find("Content-Length: 21\r\n\r\nHTTP/1.1 200 OK\r\n\r\nhi\r\n\r\n") !=
          std::string::npos);
    CHECK(wire.ends_with("hi\r\n\r\n"));
}

TEST_CASE("WARC: writer adds record id and block digest", "[warc]") {
    WarcWriter writer;
    const auto id = writer.write(response_record("payload"));
    REQUIRE(id.is_ok());
    CHECK(id.value().starts_with("<urn:uuid:"));
    CHECK(id.value().ends_with(">"));

    const auto records = warc::read_all(writer.data());
    REQUIRE(records.is_ok());
    REQUIRE(records.value().size() == 1);

    const WarcRecord& read = records.value()[0];
    CHECK(read.type() == "response");
    CHECK(read.record_id() == id.value());
    CHECK(read.field("WARC-Block-Digest") == digest::sha256_label("payload"));
    CHECK(read.field("content-length") == "7");
    CHECK(read.block == "payload");
}

TEST_CASE("WARC: warcinfo comes first and blocks keep binary bytes", "[warc]") {
    WarcWriter writer;
    REQUIRE(writer.write_warcinfo("data.warc", "webcapture 1.0.0", "2026-10-18T09:41:07.123Z").is_ok());
    const std::string binary("\0\r\n\r\n\xff\x00WARC/1.1", 15);
    REQUIRE(writer.write(response_record(binary)).is_ok());
    CHECK(writer.record_count() == 2);

    const auto records = warc::read_all(writer.data());
    REQUIRE(records.is_ok());
    REQUIRE(records.value().size() == 2);
    CHECK(records.value()[0].type() == "warcinfo");
    CHECK(records.value()[0].block.find("software: webcapture 1.0.0") != std::string::npos);
    CHECK(records.value()[1].block == binary);
}

TEST_CASE("WARC: gzip output is one member per record and reads back", "[warc]") {
    WarcWriter plain;
    WarcWriter gzipped(true);
    for (auto* writer : {&plain, &gzipped}) {
        REQUIRE(writer->write(response_record("first")).is_ok());
        REQUIRE(writer->write(response_record("second")).is_ok());
    }

    CHECK(gzipped.data().starts_with("\x1f\x8b"));
    const auto records = warc::read_all(gzipped.data());
    REQUIRE(records.is_ok());
    REQUIRE(records.value().size() == 2);
    CHECK(records.value()[0].block == "first");
    CHECK(records.value()[1].block == "second");
}

TEST_CASE("WARC: writer rejects multi-line field values", "[warc]") {
    WarcWriter writer;
    WarcRecord record = response_record("x");
    record.fields.emplace_back("WARC-Exchange-ID", "evil\r\nWARC-Type: metadata");
    const auto result = writer.write(record);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::ENCODE_ERROR);
    CHECK(writer.data().empty());
}

TEST_CASE("WARC: field values keep surrounding whitespace", "[warc]") {
    WarcWriter writer;
    WarcRecord record = response_record("x");
    record.fields.emplace_back("WARC-Exchange-ID", " a ");
    record.fields.emplace_back("WARC-Exchange-Description", "");
    REQUIRE(writer.write(record).is_ok());

    const auto records = warc::read_all(writer.data());
    REQUIRE(records.is_ok());
    REQUIRE(records.value().size() == 1);
    CHECK(records.value()[0].field("WARC-Exchange-ID") == " a ");
    CHECK(records.value()[0].field("WARC-Exchange-Description") == "");
    CHECK(records.value()[0].field("WARC-Type") == "response");
}

TEST_CASE("WARC: reader validation", "[warc]") {
    const auto expect_error = [](const std::string& data, const std::string& fragment) {
        const auto result = warc::read_all(data);
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::DECODE_ERROR);
        CHECK(result.error_message().find(fragment) != std::string::npos);
    };

    SECTION("unknown version") {
        expect_error("WARC/2.0\r\nContent-Length: 0\r\n\r\n\r\n\r\n", "unsupported version");
    }
    SECTION("field without colon") {
        expect_error("WARC/1.1\r\nWARC-Type response\r\nContent-Length: 0\r\n\r\n\r\n\r\n",
                     "invalid field line");
    }
    SECTION("missing Content-Length") {
        expect_error("WARC/1.1\r\nWARC-Type: response\r\n\r\n\r\n\r\n", "missing Content-Length");
    }
    SECTION("non-numeric Content-Length") {
        expect_error("WARC/1.1\r\nContent-Length: ten\r\n\r\n\r\n\r\n", "invalid Content-Length");
    }
    SECTION("Content-Length past the end") {
        expect_error("WARC/1.1\r\nContent-Length: 100\r\n\r\nshort\r\n\r\n", "exceeds remaining");
    }
    SECTION("missing record terminator") {
        expect_error("WARC/1.1\r\nContent-Length: 2\r\n\r\nabXX", "CRLF CRLF");
    }
    SECTION("WARC/1.0 is accepted") {
        const auto result = warc::read_all("WARC/1.0\r\nContent-Length: 2\r\n\r\nab\r\n\r\n");
        REQUIRE(result.is_ok());
        CHECK(result.value()[0].version == "WARC/1.0");
    }
}
