#include "config/options_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <filesystem>
#include <format>
#include <functional>
#include <limits>
#include <string_view>
#include <unordered_map>

namespace webcapture {

namespace {

constexpr std::string_view kCaptureTable = "capture";

// Returns an error message, or empty on success.
using FieldSetter = std::function<std::string(const toml::node&, CaptureOptions&)>;

FieldSetter bool_field(bool CaptureOptions::*member) {
    return [member](const toml::node& node, CaptureOptions& opts) -> std::string {
        const auto value = node.value<bool>();
        if (!node.is_boolean() || !value) return "expected a boolean";
        opts.*member = *value;
        return {};
    };
}

template<typename T>
FieldSetter int_field(T CaptureOptions::*member, int64_t min, int64_t max) {
    return [member, min, max](const toml::node& node, CaptureOptions& opts) -> std::string {
        const auto value = node.value<int64_t>();
        if (!node.is_integer() || !value) return "expected an integer";
        if (*value < min || *value > max) {
            return std::format("must be between {} and {}", min, max);
        }
        opts.*member = static_cast<T>(*value);
        return {};
    };
}

FieldSetter timeout_field(std::chrono::milliseconds CaptureOptions::*member) {
    return [member](const toml::node& node, CaptureOptions& opts) -> std::string {
        const auto value = node.value<int64_t>();
        if (!node.is_integer() || !value) return "expected an integer (milliseconds)";
        if (*value <= 0) return "must be positive";
        opts.*member = std::chrono::milliseconds(*value);
        return {};
    };
}

FieldSetter string_field(std::string CaptureOptions::*member) {
    return [member](const toml::node& node, CaptureOptions& opts) -> std::string {
        const auto value = node.value<std::string>();
        if (!node.is_string() || !value) return "expected a string";
        if (value->empty()) return "must not be empty";
        opts.*member = *value;
        return {};
    };
}

const std::unordered_map<std::string_view, FieldSetter>& field_setters() {
    static const std::unordered_map<std::string_view, FieldSetter> setters = {
        {"headless",                    bool_field(&CaptureOptions::headless)},
        {"capture_window_x",            int_field(&CaptureOptions::capture_window_x, 1, 16384)},
        {"capture_window_y",            int_field(&CaptureOptions::capture_window_y, 1, 16384)},
        {"proxy_host",                  string_field(&CaptureOptions::proxy_host)},
        {"proxy_port",                  int_field(&CaptureOptions::proxy_port, 1, 65535)},
        {"proxy_verbose",               bool_field(&CaptureOptions::proxy_verbose)},
        {"load_timeout_ms",             timeout_field(&CaptureOptions::load_timeout)},
        {"network_idle_timeout_ms",     timeout_field(&CaptureOptions::network_idle_timeout)},
        {"behaviors_timeout_ms",        timeout_field(&CaptureOptions::behaviors_timeout)},
        {"auto_scroll_timeout_ms",      timeout_field(&CaptureOptions::auto_scroll_timeout)},
        {"screenshot_timeout_ms",       timeout_field(&CaptureOptions::screenshot_timeout)},
        {"max_size",                    int_field(&CaptureOptions::max_size, 1,
                                                  std::numeric_limits<int64_t>::max())},
        {"grab_secondary_resources",    bool_field(&CaptureOptions::grab_secondary_resources)},
        {"auto_play_media",             bool_field(&CaptureOptions::auto_play_media)},
        {"run_site_specific_behaviors", bool_field(&CaptureOptions::run_site_specific_behaviors)},
        {"auto_scroll",                 bool_field(&CaptureOptions::auto_scroll)},
        {"screenshot",                  bool_field(&CaptureOptions::screenshot)},
        {"include_raw",                 bool_field(&CaptureOptions::include_raw)},
        {"provenance_summary",          bool_field(&CaptureOptions::provenance_summary)},
        {"verbose",                     bool_field(&CaptureOptions::verbose)},
    };
    return setters;
}

OptionsLoader::LoadResult extract_options(const toml::table& root) {
    for (const auto& [key, node] : root) {
        if (key.str() != kCaptureTable) {
            return OptionsLoader::LoadResult::error(
                std::format("Unknown config section: {}", key.str()));
        }
        if (!node.is_table()) {
            return OptionsLoader::LoadResult::error("capture: expected a table");
        }
    }

    CaptureOptions options;
    const auto* capture = root[kCaptureTable].as_table();
    if (!capture) {
        return OptionsLoader::LoadResult::ok(options);
    }

    const auto& setters = field_setters();
    for (const auto& [key, node] : *capture) {
        const auto it = setters.find(key.str());
        if (it == setters.end()) {
            return OptionsLoader::LoadResult::error(
                std::format("Unknown option: capture.{}", key.str()));
        }
        const std::string err = it->second(node, options);
        if (!err.empty()) {
            return OptionsLoader::LoadResult::error(
                std::format("Invalid option capture.{}: {}", key.str(), err));
        }
    }
    return OptionsLoader::LoadResult::ok(options);
}

} // anonymous namespace

// ============================================================================
// OptionsLoader
// ============================================================================

OptionsLoader::LoadResult OptionsLoader::load_from_file(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return LoadResult::error(std::format("Config file not found: {}", path));
    }
    try {
        const toml::table root = toml::parse_file(path);
        return extract_options(root);
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("Failed to parse {}: {}", path, e.what()));
    }
}

OptionsLoader::LoadResult OptionsLoader::load_from_string(const std::string& toml_content) {
    try {
        const toml::table root = toml::parse(toml_content);
        return extract_options(root);
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Options serialization
// ============================================================================

nlohmann::json options_to_json(const CaptureOptions& options) {
    return {
        {"headless", options.headless},
        {"capture_window_x", options.capture_window_x},
        {"capture_window_y", options.capture_window_y},
        {"proxy_host", options.proxy_host},
        {"proxy_port", options.proxy_port},
        {"proxy_verbose", options.proxy_verbose},
        {"load_timeout_ms", options.load_timeout.count()},
        {"network_idle_timeout_ms", options.network_idle_timeout.count()},
        {"behaviors_timeout_ms", options.behaviors_timeout.count()},
        {"auto_scroll_timeout_ms", options.auto_scroll_timeout.count()},
        {"screenshot_timeout_ms", options.screenshot_timeout.count()},
        {"max_size", options.max_size},
        {"grab_secondary_resources", options.grab_secondary_resources},
        {"auto_play_media", options.auto_play_media},
        {"run_site_specific_behaviors", options.run_site_specific_behaviors},
        {"auto_scroll", options.auto_scroll},
        {"screenshot", options.screenshot},
        {"include_raw", options.include_raw},
        {"provenance_summary", options.provenance_summary},
        {"verbose", options.verbose},
    };
}

// ============================================================================
// URL validation
// ============================================================================

Result<std::string> validate_url(const std::string& url) {
    const auto fail = [&url](std::string_view reason) {
        return Result<std::string>::error(ErrorCategory::CONFIGURATION_ERROR,
            std::format("Invalid url provided ({}): {}", reason, url));
    };

    for (const char c : url) {
        if (static_cast<unsigned char>(c) <= 0x20 || c == 0x7F) {
            return fail("contains whitespace or control characters");
        }
    }

    const size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return fail("not an absolute url");
    }
    const std::string scheme = utils::to_lower(url.substr(0, scheme_end));
    if (scheme != "http" && scheme != "https") {
        return fail("invalid protocol");
    }

    const size_t authority_start = scheme_end + 3;
    const size_t authority_end = url.find_first_of("/?#", authority_start);
    std::string authority = url.substr(authority_start,
        authority_end == std::string::npos ? std::string::npos : authority_end - authority_start);

    const size_t at = authority.rfind('@');
    const std::string userinfo = (at == std::string::npos) ? "" : authority.substr(0, at + 1);
    const std::string host_port = utils::to_lower(
        at == std::string::npos ? authority : authority.substr(at + 1));

    const size_t colon = host_port.rfind(':');
    const bool has_port = colon != std::string::npos && host_port.find(']', colon) == std::string::npos;
    const std::string host = has_port ? host_port.substr(0, colon) : host_port;
    if (host.empty()) {
        return fail("missing host");
    }
    if (has_port) {
        const auto port = utils::try_parse_int<uint32_t>(std::string_view(host_port).substr(colon + 1));
        if (!port || *port == 0 || *port > 65535) {
            return fail("invalid port");
        }
    }

    std::string rest = (authority_end == std::string::npos) ? "" : url.substr(authority_end);
    if (rest.empty() || rest.front() != '/') {
        rest.insert(rest.begin(), '/');
    }
    return Result<std::string>::ok(std::format("{}://{}{}{}", scheme, userinfo, host_port, rest));
}

} // namespace webcapture
