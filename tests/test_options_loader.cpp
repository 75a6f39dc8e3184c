#include <catch2/catch_test_macros.hpp>
#include "config/options_loader.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

using namespace webcapture;

TEST_CASE("OptionsLoader: empty document yields defaults", "[config]") {
    const auto result = OptionsLoader::load_from_string("");
    REQUIRE(result.success);
    CHECK(result.options == CaptureOptions{});
}

TEST_CASE("OptionsLoader: recognized keys are applied", "[config]") {
    const auto result = OptionsLoader::load_from_string(R"(
[capture]
headless = false
proxy_host = "127.0.0.1"
proxy_port = 9100
load_timeout_ms = 5000
max_size = 1048576
screenshot = false
include_raw = true
capture_window_x = 1280
)");
    REQUIRE(result.success);
    const CaptureOptions& o = result.options;
    CHECK_FALSE(o.headless);
    CHECK(o.proxy_host == "127.0.0.1");
    CHECK(o.proxy_port == 9100);
    CHECK(o.load_timeout == std::chrono::milliseconds(5000));
    CHECK(o.max_size == 1048576);
    CHECK_FALSE(o.screenshot);
    CHECK(o.include_raw);
    CHECK(o.capture_window_x == 1280);
    // Untouched keys keep defaults
    CHECK(o.capture_window_y == 900);
    CHECK(o.provenance_summary);
}

TEST_CASE("OptionsLoader: unknown keys are rejected", "[config]") {
    SECTION("unknown option") {
        const auto result = OptionsLoader::load_from_string("[capture]\nmaxSize = 10\n");
        REQUIRE_FALSE(result.success);
        CHECK(result.error_message == "Unknown option: capture.maxSize");
    }

    SECTION("unknown section") {
        const auto result = OptionsLoader::load_from_string("[server]\nport = 1\n");
        REQUIRE_FALSE(result.success);
        CHECK(result.error_message == "Unknown config section: server");
    }
}

TEST_CASE("OptionsLoader: wrong types and ranges are rejected", "[config]") {
    struct Case { const char* toml; const char* key; };
    const Case cases[] = {
        {"[capture]\nheadless = \"yes\"\n", "capture.headless"},
        {"[capture]\nproxy_port = 70000\n", "capture.proxy_port"},
        {"[capture]\nproxy_port = 0\n", "capture.proxy_port"},
        {"[capture]\nload_timeout_ms = 0\n", "capture.load_timeout_ms"},
        {"[capture]\nmax_size = -1\n", "capture.max_size"},
        {"[capture]\nproxy_host = \"\"\n", "capture.proxy_host"},
        {"[capture]\nscreenshot = 1\n", "capture.screenshot"},
    };

    for (const auto& c : cases) {
        INFO(c.toml);
        const auto result = OptionsLoader::load_from_string(c.toml);
        REQUIRE_FALSE(result.success);
        CHECK(result.error_message.find(std::string("Invalid option ") + c.key) == 0);
    }
}

TEST_CASE("OptionsLoader: syntax errors are reported", "[config]") {
    const auto result = OptionsLoader::load_from_string("[capture\nheadless = true\n");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") == 0);
}

TEST_CASE("OptionsLoader: load from file", "[config]") {
    const auto path = std::filesystem::temp_directory_path() / "webcapture_options_test.toml";
    {
        std::ofstream out(path);
        out << "[capture]\nverbose = true\nauto_scroll = false\n";
    }

    const auto result = OptionsLoader::load_from_file(path.string());
    std::filesystem::remove(path);

    REQUIRE(result.success);
    CHECK(result.options.verbose);
    CHECK_FALSE(result.options.auto_scroll);

    const auto missing = OptionsLoader::load_from_file(path.string());
    REQUIRE_FALSE(missing.success);
    CHECK(missing.error_message.find("Config file not found") == 0);
}

TEST_CASE("OptionsLoader: options serialize under their TOML keys", "[config]") {
    CaptureOptions options;
    options.max_size = 42;
    const auto json = options_to_json(options);
    CHECK(json["max_size"] == 42);
    CHECK(json["load_timeout_ms"] == 20000);
    CHECK(json["include_raw"] == false);
    CHECK(json.size() == 20);
}

TEST_CASE("validate_url: accepts and normalizes http(s) urls", "[config]") {
    CHECK(validate_url("https://example.com").value() == "https://example.com/");
    CHECK(validate_url("HTTP://Example.COM/Path?q=1").value() == "http://example.com/Path?q=1");
    CHECK(validate_url("https://example.com:8443/a").value() == "https://example.com:8443/a");
    CHECK(validate_url("https://example.com?q").value() == "https://example.com/?q");
}

TEST_CASE("validate_url: rejects everything else", "[config]") {
    for (const char* url : {"", "example.com", "ftp://example.com/", "https:///path",
                            "https://example.com:0/", "https://example.com:99999/",
                            "https://exa mple.com/", "javascript:alert(1)"}) {
        INFO(url);
        const auto result = validate_url(url);
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::CONFIGURATION_ERROR);
        CHECK(result.error_message().find("Invalid url provided") == 0);
    }
}
