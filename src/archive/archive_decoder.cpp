#include "archive/archive_decoder.hpp"
#include "archive/warc_reader.hpp"

#include <format>
#include <fstream>
#include <sstream>
#include <unordered_map>

namespace webcapture {

namespace {

using CaptureResult = Result<std::unique_ptr<Capture>>;

CaptureResult decode_error(std::string message) {
    return CaptureResult::error(ErrorCategory::DECODE_ERROR, std::move(message));
}

/// Request/response records grouped back into exchanges, in record order
template<typename T>
struct ExchangeGroup {
    std::vector<T> exchanges;
    std::unordered_map<std::string, size_t> by_request_record;
};

} // anonymous namespace

Result<std::unique_ptr<Capture>> ArchiveDecoder::decode(std::string_view bytes) {
    auto container = WaczContainer::parse(bytes);
    if (container.is_error()) {
        return CaptureResult::error(container.error_category(), container.error_message());
    }
    return from_container(container.value());
}

Result<std::unique_ptr<Capture>> ArchiveDecoder::decode_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return decode_error(std::format("Cannot open archive file: {}", path));
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return decode_error(std::format("Failed to read archive file: {}", path));
    }
    return decode(buffer.str());
}

Result<std::unique_ptr<Capture>> ArchiveDecoder::from_container(const WaczContainer& container) {
    const std::string* warc_bytes = container.file(wacz::kWarcPath);
    if (!warc_bytes) {
        return decode_error(std::format("Invalid WACZ: missing {}", wacz::kWarcPath));
    }
    auto records = warc::read_all(*warc_bytes);
    if (records.is_error()) {
        return CaptureResult::error(records.error_category(), records.error_message());
    }

    std::optional<nlohmann::json> provenance;
    if (container.datapackage_extras) {
        const auto it = container.datapackage_extras->find("provenanceInfo");
        if (it != container.datapackage_extras->end()) {
            provenance = *it;
        }
    }

    CaptureOptions options;
    options.provenance_summary = provenance.has_value();

    auto created = Capture::create(container.main_page_url, options);
    if (created.is_error()) {
        return decode_error(std::format("Invalid WACZ: mainPageUrl '{}' is not usable: {}",
                                        container.main_page_url, created.error_message()));
    }
    std::unique_ptr<Capture> capture = std::move(created.value());

    // ------------------------------------------------------------------------
    // Records → exchanges
    // ------------------------------------------------------------------------

    ExchangeGroup<Exchange> intercepted;
    ExchangeGroup<GeneratedExchange> generated;

    for (size_t i = 0; i < records.value().size(); ++i) {
        WarcRecord& record = records.value()[i];
        const std::string type = record.type();
        if (type != "request" && type != "response") {
            continue;  // warcinfo and anything we did not write
        }

        const auto date = record.field("WARC-Date");
        const auto timestamp = date ? utils::parse_iso8601(*date) : std::nullopt;
        if (!timestamp) {
            return decode_error(std::format("Invalid WARC: record #{} has no valid WARC-Date", i));
        }
        const bool is_generated = record.field("WARC-Generated-Exchange") == "true";
        const std::string exchange_id = record.field("WARC-Exchange-ID").value_or("");

        if (is_generated) {
            GeneratedExchange* target = nullptr;
            if (type == "response") {
                if (const auto to = record.field("WARC-Concurrent-To")) {
                    const auto it = generated.by_request_record.find(*to);
                    if (it != generated.by_request_record.end()) {
                        target = &generated.exchanges[it->second];
                    }
                }
            }
            if (!target) {
                GeneratedExchange exchange;
                exchange.id = exchange_id;
                exchange.timestamp = *timestamp;
                exchange.url = record.field("WARC-Target-URI").value_or("");
                exchange.description = record.field("WARC-Exchange-Description").value_or("");
                generated.exchanges.push_back(std::move(exchange));
                target = &generated.exchanges.back();
                if (type == "request") {
                    generated.by_request_record[record.record_id()] = generated.exchanges.size() - 1;
                }
            }

            if (type == "request") {
                target->parsed_request = http::parse_request(record.block);
                if (!target->parsed_request) {
                    return decode_error(std::format(
                        "Invalid WARC: generated request record #{} is not an HTTP request", i));
                }
            } else if (!record.block.empty()) {
                target->parsed_response = http::parse_response(record.block);
                if (!target->parsed_response) {
                    return decode_error(std::format(
                        "Invalid WARC: generated response record #{} is not an HTTP response", i));
                }
            }
            continue;
        }

        if (type == "request") {
            Exchange exchange;
            exchange.id = exchange_id;
            exchange.timestamp = *timestamp;
            exchange.request_raw = std::move(record.block);
            intercepted.exchanges.push_back(std::move(exchange));
            intercepted.by_request_record[record.record_id()] = intercepted.exchanges.size() - 1;
            continue;
        }

        Exchange* target = nullptr;
        if (const auto to = record.field("WARC-Concurrent-To")) {
            const auto it = intercepted.by_request_record.find(*to);
            if (it != intercepted.by_request_record.end()) {
                target = &intercepted.exchanges[it->second];
            }
        }
        if (!target) {
            Exchange exchange;
            exchange.id = exchange_id;
            exchange.timestamp = *timestamp;
            intercepted.exchanges.push_back(std::move(exchange));
            target = &intercepted.exchanges.back();
        } else if (target->has_response()) {
            return decode_error(std::format(
                "Invalid WARC: record #{} is a second response for one request", i));
        }
        target->response_raw = std::move(record.block);
    }

    // Raw payloads are the unmodified capture bytes; prefer them when present
    std::unordered_map<std::string, size_t> occurrences;
    for (Exchange& exchange : intercepted.exchanges) {
        for (const Direction direction : {Direction::REQUEST, Direction::RESPONSE}) {
            std::string& bytes = exchange.raw(direction);
            if (bytes.empty()) {
                continue;
            }
            const std::string base = wacz::raw_payload_path(direction, exchange.timestamp,
                                                            exchange.id);
            const size_t occurrence = occurrences[base]++;
            if (const std::string* raw = container.file(wacz::raw_payload_path(
                    direction, exchange.timestamp, exchange.id, occurrence))) {
                bytes = *raw;
            }
        }
    }

    // Entry points: pages after the crawl's own entry page, in generation order
    size_t next_page = intercepted.exchanges.empty() ? 0 : 1;
    for (GeneratedExchange& exchange : generated.exchanges) {
        if (next_page < container.pages.size() &&
            container.pages[next_page].url == exchange.url &&
            container.pages[next_page].ts == utils::format_iso8601(exchange.timestamp)) {
            exchange.is_entry_point = true;
            ++next_page;
        }
    }

    for (Exchange& exchange : intercepted.exchanges) {
        capture->store_.push_back(std::move(exchange));
    }
    for (GeneratedExchange& exchange : generated.exchanges) {
        capture->add_generated_exchange(std::move(exchange));
    }
    if (provenance) {
        capture->set_provenance_info(std::move(*provenance));
    }
    capture->set_state(CaptureState::COMPLETE);

    return CaptureResult::ok(std::move(capture));
}

} // namespace webcapture
