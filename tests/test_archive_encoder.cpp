#include <catch2/catch_test_macros.hpp>
#include "archive/archive_encoder.hpp"
#include "archive/warc_reader.hpp"
#include "capture/capture_steps.hpp"
#include "core/digest.hpp"
#include "mocks/mock_browser_driver.hpp"

#include <optional>
#include <string>

using namespace webcapture;
using namespace webcapture::testing;

TEST_CASE("ArchiveEncoder: only PARTIAL or COMPLETE captures can be encoded", "[encoder]") {
    SECTION("INIT") {
        auto created = Capture::create("https://example.com", CaptureOptions{});
        REQUIRE(created.is_ok());
        const auto result = ArchiveEncoder::encode(*created.value(), false);
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::ENCODE_ERROR);
        CHECK(result.error_message().find("state: INIT") != std::string::npos);
    }

    SECTION("SETUP and CAPTURE") {
        MockHarness harness;
        auto created = Capture::create("https://example.com", CaptureOptions{});
        REQUIRE(created.is_ok());
        Capture& capture = *created.value();

        std::optional<ErrorCategory> during_setup;
        std::optional<ErrorCategory> during_capture;
        harness.browser->on_launch = [&] {
            CHECK(capture.state() == CaptureState::SETUP);
            during_setup = ArchiveEncoder::encode(capture, false).error_category();
        };
        harness.browser->on_navigate = [&] {
            CHECK(capture.state() == CaptureState::CAPTURE);
            during_capture = ArchiveEncoder::to_wacz(capture, false).error_category();
        };

        CaptureController controller(capture, harness.driver(), harness.transport());
        REQUIRE(controller.capture().is_ok());

        CHECK(during_setup == ErrorCategory::ENCODE_ERROR);
        CHECK(during_capture == ErrorCategory::ENCODE_ERROR);
        CHECK(ArchiveEncoder::encode(capture, false).is_ok());
    }

    SECTION("ERROR") {
        MockHarness harness;
        harness.browser->fail_launch = true;
        auto run = run_mock_capture(harness, "https://example.com", CaptureOptions{});
        REQUIRE(run.capture->state() == CaptureState::ERROR);
        CHECK(ArchiveEncoder::to_warc(*run.capture).error_category() == ErrorCategory::ENCODE_ERROR);
    }
}

TEST_CASE("ArchiveEncoder: pages are the entry exchange then generated entry points",
          "[encoder]") {
    MockHarness harness;
    harness.browser->navigation_traffic = example_com_traffic();

    auto run = run_mock_capture(harness, "https://example.com", CaptureOptions{});
    REQUIRE(run.result.is_ok());

    const auto container = ArchiveEncoder::encode(*run.capture, false);
    REQUIRE(container.is_ok());
    const auto& pages = container.value().pages;

    REQUIRE(pages.size() == 2);
    CHECK(pages[0].url == "https://example.com/");
    CHECK(pages[0].ts == utils::format_iso8601(run.capture->exchanges()[0].timestamp));
    CHECK(pages[1].url == ScreenshotStep::kScreenshotUrl);
    CHECK(pages[1].title == ScreenshotStep::kDescription);
    CHECK(pages[0].id != pages[1].id);

    CHECK(container.value().main_page_url == "https://example.com/");
    CHECK(container.value().main_page_date == pages[0].ts);
}

TEST_CASE("ArchiveEncoder: capture without traffic lists only generated pages", "[encoder]") {
    MockHarness harness;
    auto run = run_mock_capture(harness, "https://example.com", CaptureOptions{});
    REQUIRE(run.result.is_ok());

    const auto container = ArchiveEncoder::encode(*run.capture, false);
    REQUIRE(container.is_ok());
    REQUIRE(container.value().pages.size() == 1);
    CHECK(container.value().pages[0].url == ScreenshotStep::kScreenshotUrl);
}

TEST_CASE("ArchiveEncoder: WARC records reproduce the captured bytes", "[encoder]") {
    MockHarness harness;
    harness.browser->navigation_traffic = example_com_traffic();
    auto run = run_mock_capture(harness, "https://example.com", CaptureOptions{});
    REQUIRE(run.result.is_ok());

    const auto warc = ArchiveEncoder::to_warc(*run.capture);
    REQUIRE(warc.is_ok());
    const auto records = warc::read_all(warc.value());
    REQUIRE(records.is_ok());

    // warcinfo + 2 x (request, response) + screenshot response
    const auto& r = records.value();
    REQUIRE(r.size() == 6);
    CHECK(r[0].type() == "warcinfo");

    const Exchange& first = run.capture->exchanges()[0];
    CHECK(r[1].type() == "request");
    CHECK(r[1].block == first.request_raw);
    CHECK(r[1].field("Content-Type") == "application/http;msgtype=request");
    CHECK(r[1].field("WARC-Target-URI") == "https://example.com/");
    CHECK(r[1].field("WARC-Exchange-ID") == "sess-1");
    CHECK(r[1].field("WARC-Date") == utils::format_iso8601(first.timestamp));

    CHECK(r[2].type() == "response");
    CHECK(r[2].block == first.response_raw);
    CHECK(r[2].field("WARC-Concurrent-To") == r[1].record_id());
    CHECK(r[2].field("WARC-Block-Digest") == digest::sha256_label(first.response_raw));
    CHECK(r[2].field("WARC-Date") == r[1].field("WARC-Date"));

    CHECK(r[3].field("WARC-Target-URI") == "https://example.com/style.css");

    CHECK(r[5].type() == "response");
    CHECK(r[5].field("WARC-Generated-Exchange") == "true");
    CHECK(r[5].field("WARC-Target-URI") == "file:///screenshot.png");
    CHECK(r[5].field("WARC-Exchange-Description") == "Capture Time Screenshot");
    CHECK(r[5].block.starts_with("HTTP/1.1 200 OK\r\n"));
    CHECK(r[5].block.ends_with(kFakePng));
}

TEST_CASE("ArchiveEncoder: gzip WARC output", "[encoder]") {
    MockHarness harness;
    harness.browser->navigation_traffic = example_com_traffic();
    auto run = run_mock_capture(harness, "https://example.com", CaptureOptions{});
    REQUIRE(run.result.is_ok());

    const auto plain = ArchiveEncoder::to_warc(*run.capture, false);
    const auto gzipped = ArchiveEncoder::to_warc(*run.capture, true);
    REQUIRE(plain.is_ok());
    REQUIRE(gzipped.is_ok());
    CHECK(gzipped.value().starts_with("\x1f\x8b"));

    const auto records = warc::read_all(gzipped.value());
    REQUIRE(records.is_ok());
    CHECK(records.value().size() == 6);
    CHECK(records.value()[2].block == run.capture->exchanges()[0].response_raw);
}

TEST_CASE("ArchiveEncoder: raw payloads and provenance extras", "[encoder]") {
    MockHarness harness;
    harness.browser->navigation_traffic = example_com_traffic();
    auto run = run_mock_capture(harness, "https://example.com", CaptureOptions{});
    REQUIRE(run.result.is_ok());

    SECTION("without raw") {
        const auto container = ArchiveEncoder::encode(*run.capture, false);
        REQUIRE(container.is_ok());
        CHECK(container.value().files.size() == 1);
        REQUIRE(container.value().datapackage_extras.has_value());
        CHECK(container.value().datapackage_extras->contains("provenanceInfo"));
    }

    SECTION("with raw") {
        const auto container = ArchiveEncoder::encode(*run.capture, true);
        REQUIRE(container.is_ok());
        CHECK(container.value().files.size() == 5);

        const Exchange& first = run.capture->exchanges()[0];
        const std::string* raw = container.value().file(
            wacz::raw_payload_path(Direction::RESPONSE, first.timestamp, first.id));
        REQUIRE(raw != nullptr);
        CHECK(*raw == first.response_raw);
    }
}

TEST_CASE("ArchiveEncoder: provenance extras follow the option", "[encoder]") {
    MockHarness harness;
    CaptureOptions options;
    options.provenance_summary = false;
    auto run = run_mock_capture(harness, "https://example.com", options);
    REQUIRE(run.result.is_ok());

    const auto container = ArchiveEncoder::encode(*run.capture, false);
    REQUIRE(container.is_ok());
    CHECK_FALSE(container.value().datapackage_extras.has_value());
}
