#include "archive/wacz_container.hpp"
#include "archive/zip_archive.hpp"
#include "core/digest.hpp"

#include <format>

namespace webcapture {

// ============================================================================
// Paths and versions
// ============================================================================

namespace wacz {

namespace {

// '_' separates the occurrence suffix and '/' would open a directory
std::string escape_path_component(std::string_view component) {
    std::string escaped;
    escaped.reserve(component.size());
    for (const char c : component) {
        switch (c) {
            case '%': escaped += "%25"; break;
            case '/': escaped += "%2F"; break;
            case '_': escaped += "%5F"; break;
            default:  escaped += c; break;
        }
    }
    return escaped;
}

} // anonymous namespace

std::string raw_payload_path(Direction direction, utils::Timestamp timestamp,
                             std::string_view exchange_id, size_t occurrence) {
    std::string path = std::format("{}{}_{}_{}", kRawPrefix, direction_name(direction),
                                   utils::format_iso8601(timestamp),
                                   escape_path_component(exchange_id));
    if (occurrence > 0) {
        path += std::format("_{}", occurrence);
    }
    return path;
}

bool is_supported_version(std::string_view version) {
    return version == "1.0.0" || version == "1.1.0" || version == "1.1.1";
}

} // namespace wacz

namespace {

constexpr std::string_view kPagesFormat = "json-pages-1.0";

std::string basename(std::string_view path) {
    const size_t slash = path.rfind('/');
    return std::string(slash == std::string_view::npos ? path : path.substr(slash + 1));
}

std::string string_or(const nlohmann::json& obj, const char* key, std::string fallback = {}) {
    const auto it = obj.find(key);
    if (it != obj.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return fallback;
}

Result<WaczContainer> invalid(std::string message) {
    return Result<WaczContainer>::error(ErrorCategory::DECODE_ERROR,
                                        "Invalid WACZ: " + std::move(message));
}

} // anonymous namespace

// ============================================================================
// Encoding
// ============================================================================

const std::string* WaczContainer::file(std::string_view path) const {
    const auto it = files.find(std::string(path));
    return it == files.end() ? nullptr : &it->second;
}

std::string WaczContainer::pages_jsonl() const {
    std::string out = nlohmann::json{
        {"format", kPagesFormat},
        {"id", "pages"},
        {"title", "All Pages"},
    }.dump();
    out += '\n';

    for (const auto& page : pages) {
        out += nlohmann::json{
            {"id", page.id},
            {"url", page.url},
            {"ts", page.ts},
            {"title", page.title},
        }.dump();
        out += '\n';
    }
    return out;
}

nlohmann::json WaczContainer::datapackage() const {
    const auto resource = [](std::string_view path, std::string_view bytes) {
        return nlohmann::json{
            {"name", basename(path)},
            {"path", path},
            {"hash", digest::sha256_label(bytes)},
            {"bytes", bytes.size()},
        };
    };

    nlohmann::json resources = nlohmann::json::array();
    const std::string pages = pages_jsonl();
    resources.push_back(resource(wacz::kPagesPath, pages));
    for (const auto& [path, bytes] : files) {
        resources.push_back(resource(path, bytes));
    }

    nlohmann::json package = {
        {"profile", "data-package"},
        {"wacz_version", wacz_version},
        {"title", title},
        {"created", created},
        {"software", software},
        {"mainPageUrl", main_page_url},
        {"mainPageDate", main_page_date},
        {"resources", std::move(resources)},
    };
    if (datapackage_extras) {
        package["extras"] = *datapackage_extras;
    }
    return package;
}

Result<std::string> WaczContainer::serialize() const {
    std::string pages;
    std::string package;
    try {
        pages = pages_jsonl();
        package = datapackage().dump(2);
    } catch (const std::exception& e) {
        return Result<std::string>::error(ErrorCategory::ENCODE_ERROR,
            std::format("Failed to build WACZ metadata: {}", e.what()));
    }
    const std::string digest_file = nlohmann::json{
        {"path", wacz::kDatapackagePath},
        {"hash", digest::sha256_label(package)},
    }.dump(2);

    const auto created_ts = utils::parse_iso8601(created);
    ZipWriter zip(created_ts.value_or(utils::now_ms()));

    const auto add = [&zip](std::string_view path, std::string_view data, ZipMethod method) {
        return zip.add(std::string(path), data, method);
    };

    // The WARC stays uncompressed so replay tools can seek into it
    if (const std::string* warc = file(wacz::kWarcPath)) {
        if (auto r = add(wacz::kWarcPath, *warc, ZipMethod::STORED); r.is_error()) {
            return Result<std::string>::error(r.error_category(), r.error_message());
        }
    }
    if (auto r = add(wacz::kPagesPath, pages, ZipMethod::DEFLATED); r.is_error()) {
        return Result<std::string>::error(r.error_category(), r.error_message());
    }
    for (const auto& [path, bytes] : files) {
        if (path == wacz::kWarcPath) {
            continue;
        }
        if (auto r = add(path, bytes, ZipMethod::DEFLATED); r.is_error()) {
            return Result<std::string>::error(r.error_category(), r.error_message());
        }
    }
    if (auto r = add(wacz::kDatapackagePath, package, ZipMethod::DEFLATED); r.is_error()) {
        return Result<std::string>::error(r.error_category(), r.error_message());
    }
    if (auto r = add(wacz::kDigestPath, digest_file, ZipMethod::DEFLATED); r.is_error()) {
        return Result<std::string>::error(r.error_category(), r.error_message());
    }

    return zip.finish();
}

// ============================================================================
// Decoding
// ============================================================================

Result<WaczContainer> WaczContainer::parse(std::string_view bytes) {
    auto entries = ZipReader::read_all(bytes);
    if (entries.is_error()) {
        return Result<WaczContainer>::error(entries.error_category(), entries.error_message());
    }

    std::map<std::string, std::string> all;
    for (auto& entry : entries.value()) {
        all.emplace(std::move(entry.name), std::move(entry.data));
    }

    const auto package_it = all.find(std::string(wacz::kDatapackagePath));
    if (package_it == all.end()) {
        return invalid(std::format("missing {}", wacz::kDatapackagePath));
    }
    for (const auto required : {wacz::kWarcPath, wacz::kPagesPath}) {
        if (!all.contains(std::string(required))) {
            return invalid(std::format("missing {}", required));
        }
    }

    nlohmann::json package;
    try {
        package = nlohmann::json::parse(package_it->second);
    } catch (const nlohmann::json::parse_error& e) {
        return invalid(std::format("{} is not valid JSON: {}", wacz::kDatapackagePath, e.what()));
    }
    if (!package.is_object()) {
        return invalid(std::format("{} is not a JSON object", wacz::kDatapackagePath));
    }

    WaczContainer container;
    container.wacz_version = string_or(package, "wacz_version");
    if (!wacz::is_supported_version(container.wacz_version)) {
        return invalid(std::format("unsupported wacz_version '{}'", container.wacz_version));
    }
    container.title = string_or(package, "title");
    container.software = string_or(package, "software");
    container.created = string_or(package, "created");
    container.main_page_url = string_or(package, "mainPageUrl");
    container.main_page_date = string_or(package, "mainPageDate");
    if (const auto extras = package.find("extras"); extras != package.end()) {
        if (!extras->is_object()) {
            return invalid("extras is not a JSON object");
        }
        container.datapackage_extras = *extras;
    }

    // Resource hashes
    const auto resources = package.find("resources");
    if (resources == package.end() || !resources->is_array()) {
        return invalid("datapackage has no resources list");
    }
    for (const auto& res : *resources) {
        if (!res.is_object()) {
            return invalid("resource entry is not an object");
        }
        const std::string path = string_or(res, "path");
        const auto file_it = all.find(path);
        if (file_it == all.end()) {
            return invalid(std::format("resource '{}' listed but not present", path));
        }
        const std::string expected = string_or(res, "hash");
        if (expected != digest::sha256_label(file_it->second)) {
            return invalid(std::format("hash mismatch for '{}'", path));
        }
        if (const auto size = res.find("bytes");
            size != res.end() && (!size->is_number_unsigned() ||
                                  size->get<uint64_t>() != file_it->second.size())) {
            return invalid(std::format("size mismatch for '{}'", path));
        }
    }

    if (const auto digest_it = all.find(std::string(wacz::kDigestPath)); digest_it != all.end()) {
        nlohmann::json digest_json = nlohmann::json::parse(digest_it->second, nullptr, false);
        if (!digest_json.is_object() ||
            string_or(digest_json, "hash") != digest::sha256_label(package_it->second)) {
            return invalid(std::format("{} does not match {}", wacz::kDigestPath,
                                       wacz::kDatapackagePath));
        }
    }

    // Pages
    const std::string& pages_text = all.at(std::string(wacz::kPagesPath));
    for (const auto& line : utils::split(pages_text, '\n')) {
        if (utils::trim(line).empty()) {
            continue;
        }
        nlohmann::json obj = nlohmann::json::parse(line, nullptr, false);
        if (!obj.is_object()) {
            return invalid(std::format("malformed line in {}", wacz::kPagesPath));
        }
        if (obj.contains("format")) {
            continue;  // header line
        }
        if (!obj.contains("url") || !obj["url"].is_string()) {
            return invalid(std::format("page without url in {}", wacz::kPagesPath));
        }
        container.pages.push_back(WaczPage{
            .id = string_or(obj, "id"),
            .url = string_or(obj, "url"),
            .ts = string_or(obj, "ts"),
            .title = string_or(obj, "title"),
        });
    }

    for (auto& [path, data] : all) {
        if (path == wacz::kPagesPath || path == wacz::kDatapackagePath ||
            path == wacz::kDigestPath) {
            continue;
        }
        container.files.emplace(path, std::move(data));
    }

    return Result<WaczContainer>::ok(std::move(container));
}

} // namespace webcapture
