#pragma once

#include "capture/exchange.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace webcapture {

namespace wacz {

inline constexpr std::string_view kVersion = "1.1.1";
inline constexpr std::string_view kWarcPath = "archive/data.warc";
inline constexpr std::string_view kPagesPath = "pages/pages.jsonl";
inline constexpr std::string_view kDatapackagePath = "datapackage.json";
inline constexpr std::string_view kDigestPath = "datapackage-digest.json";
inline constexpr std::string_view kRawPrefix = "raw/";

/**
 * @brief Path of a raw exchange payload
 *
 * "raw/{request|response}_{ISO timestamp}_{id}". occurrence > 0 marks the
 * n-th repeat of the same direction/timestamp/id and appends "_{n}".
 * '%', '/' and '_' in the id are percent-escaped so no two
 * (id, occurrence) pairs share a path.
 */
[[nodiscard]] std::string raw_payload_path(Direction direction, utils::Timestamp timestamp,
                                           std::string_view exchange_id, size_t occurrence = 0);

[[nodiscard]] bool is_supported_version(std::string_view version);

} // namespace wacz

/// One line of pages.jsonl
struct WaczPage {
    std::string id;
    std::string url;
    std::string ts;
    std::string title;

    bool operator==(const WaczPage&) const = default;
};

/**
 * @brief In-memory WACZ package
 *
 * `files` holds every payload that is not derived (the WARC file and raw
 * exchanges). pages.jsonl, datapackage.json and datapackage-digest.json
 * are generated by serialize() and consumed by parse().
 */
class WaczContainer {
public:
    std::map<std::string, std::string> files;
    std::vector<WaczPage> pages;
    std::optional<nlohmann::json> datapackage_extras;

    std::string title = "webcapture";
    std::string software;
    std::string main_page_url;
    std::string main_page_date;
    std::string created;
    std::string wacz_version = std::string(wacz::kVersion);

    /// Bytes of a file, or nullptr
    [[nodiscard]] const std::string* file(std::string_view path) const;

    [[nodiscard]] std::string pages_jsonl() const;

    /**
     * @brief datapackage.json over the current files and pages
     * @throws std::runtime_error if hashing fails (OpenSSL)
     */
    [[nodiscard]] nlohmann::json datapackage() const;

    /// ZIP bytes; ENCODE_ERROR when ZIP limits are exceeded
    [[nodiscard]] Result<std::string> serialize() const;

    /**
     * @brief Parse and validate WACZ bytes
     *
     * Checks ZIP integrity, required files, wacz_version, every listed
     * resource hash and the datapackage digest when present.
     * @return DECODE_ERROR on any structural violation
     */
    [[nodiscard]] static Result<WaczContainer> parse(std::string_view bytes);
};

} // namespace webcapture
