#include "archive/archive_encoder.hpp"
#include "archive/warc_writer.hpp"
#include "capture/capture_controller.hpp"

#include <format>
#include <unordered_map>

namespace webcapture {

namespace {

bool is_archivable(CaptureState state) {
    return state == CaptureState::PARTIAL || state == CaptureState::COMPLETE;
}

template<typename T>
Result<T> invalid_state(const Capture& capture) {
    return Result<T>::error(ErrorCategory::ENCODE_ERROR,
        std::format("Capture must be PARTIAL or COMPLETE to be archived (state: {})",
                    capture_state_name(capture.state())));
}

std::string software_label() {
    return std::format("{} {}", kSoftwareName, kSoftwareVersion);
}

WarcRecord http_record(std::string_view type, const std::string& date,
                       const std::optional<std::string>& target_uri,
                       const std::string& exchange_id, std::string block) {
    WarcRecord record;
    record.fields.emplace_back("WARC-Type", std::string(type));
    record.fields.emplace_back("WARC-Date", date);
    if (target_uri) {
        record.fields.emplace_back("WARC-Target-URI", *target_uri);
    }
    record.fields.emplace_back("WARC-Exchange-ID", exchange_id);
    record.fields.emplace_back("Content-Type", std::string(type == "request"
        ? warc::kHttpRequestType : warc::kHttpResponseType));
    record.block = std::move(block);
    return record;
}

} // anonymous namespace

// ============================================================================
// WARC
// ============================================================================

Result<std::string> ArchiveEncoder::to_warc(const Capture& capture, bool gzip) {
    if (!is_archivable(capture.state())) {
        return invalid_state<std::string>(capture);
    }

    WarcWriter writer(gzip);
    auto info = writer.write_warcinfo(gzip ? "data.warc.gz" : "data.warc", software_label(),
                                      utils::format_iso8601(utils::now_ms()));
    if (info.is_error()) {
        return Result<std::string>::error(info.error_category(), info.error_message());
    }

    try {
        for (const Exchange& exchange : capture.exchanges()) {
            const std::string date = utils::format_iso8601(exchange.timestamp);
            const auto target = exchange.request_url();

            // Always written, even when empty, so every exchange has an anchor record
            auto request_id = writer.write(http_record("request", date, target, exchange.id,
                                                       exchange.request_raw));
            if (request_id.is_error()) {
                return Result<std::string>::error(request_id.error_category(),
                                                  request_id.error_message());
            }

            if (exchange.has_response()) {
                WarcRecord response = http_record("response", date, target, exchange.id,
                                                  exchange.response_raw);
                response.fields.emplace_back("WARC-Concurrent-To", request_id.value());
                auto written = writer.write(std::move(response));
                if (written.is_error()) {
                    return Result<std::string>::error(written.error_category(),
                                                      written.error_message());
                }
            }
        }

        for (const GeneratedExchange& generated : capture.generated_exchanges()) {
            const std::string date = utils::format_iso8601(generated.timestamp);
            const auto tag = [&generated](WarcRecord& record) {
                record.fields.emplace_back("WARC-Generated-Exchange", "true");
                if (!generated.description.empty()) {
                    record.fields.emplace_back("WARC-Exchange-Description", generated.description);
                }
            };

            std::optional<std::string> request_id;
            if (generated.parsed_request) {
                WarcRecord request = http_record("request", date, generated.url, generated.id,
                                                 http::serialize(*generated.parsed_request));
                tag(request);
                auto written = writer.write(std::move(request));
                if (written.is_error()) {
                    return Result<std::string>::error(written.error_category(),
                                                      written.error_message());
                }
                request_id = std::move(written.value());
            }

            WarcRecord response = http_record("response", date, generated.url, generated.id,
                generated.parsed_response ? http::serialize(*generated.parsed_response) : "");
            if (request_id) {
                response.fields.emplace_back("WARC-Concurrent-To", *request_id);
            }
            tag(response);
            auto written = writer.write(std::move(response));
            if (written.is_error()) {
                return Result<std::string>::error(written.error_category(),
                                                  written.error_message());
            }
        }
    } catch (const std::exception& e) {
        return Result<std::string>::error(ErrorCategory::ENCODE_ERROR,
            std::format("Failed to write WARC records: {}", e.what()));
    }

    return Result<std::string>::ok(writer.release());
}

// ============================================================================
// WACZ
// ============================================================================

Result<WaczContainer> ArchiveEncoder::encode(const Capture& capture, bool include_raw) {
    if (!is_archivable(capture.state())) {
        return invalid_state<WaczContainer>(capture);
    }

    auto warc = to_warc(capture, false);
    if (warc.is_error()) {
        return Result<WaczContainer>::error(warc.error_category(), warc.error_message());
    }

    WaczContainer container;
    container.software = software_label();
    container.created = utils::format_iso8601(utils::now_ms());
    container.main_page_url = capture.url();
    container.files.emplace(std::string(wacz::kWarcPath), std::move(warc.value()));

    if (capture.options().provenance_summary) {
        if (auto provenance = capture.provenance_info()) {
            container.datapackage_extras = nlohmann::json{{"provenanceInfo", std::move(*provenance)}};
        }
    }

    if (include_raw) {
        std::unordered_map<std::string, size_t> occurrences;
        for (const Exchange& exchange : capture.exchanges()) {
            for (const Direction direction : {Direction::REQUEST, Direction::RESPONSE}) {
                const std::string& bytes = exchange.raw(direction);
                if (bytes.empty()) {
                    continue;
                }
                const std::string base = wacz::raw_payload_path(direction, exchange.timestamp,
                                                                exchange.id);
                const size_t occurrence = occurrences[base]++;
                const std::string path = wacz::raw_payload_path(direction, exchange.timestamp,
                                                                exchange.id, occurrence);
                if (!container.files.emplace(path, bytes).second) {
                    return Result<WaczContainer>::error(ErrorCategory::ENCODE_ERROR,
                        std::format("Raw payload path '{}' is used twice", path));
                }
            }
        }
    }

    // The first exchange is the entry point of the whole crawl
    if (!capture.exchanges().empty()) {
        const Exchange& first = capture.exchanges().front();
        const std::string url = first.request_url().value_or(capture.url());
        container.pages.push_back(WaczPage{
            .id = utils::generate_uuid(),
            .url = url,
            .ts = utils::format_iso8601(first.timestamp),
            .title = url,
        });
    }
    for (const GeneratedExchange& generated : capture.generated_exchanges()) {
        if (!generated.is_entry_point) {
            continue;
        }
        container.pages.push_back(WaczPage{
            .id = utils::generate_uuid(),
            .url = generated.url,
            .ts = utils::format_iso8601(generated.timestamp),
            .title = generated.description.empty() ? generated.url : generated.description,
        });
    }

    container.main_page_date = container.pages.empty() ? container.created
                                                       : container.pages.front().ts;

    return Result<WaczContainer>::ok(std::move(container));
}

Result<std::string> ArchiveEncoder::to_wacz(const Capture& capture, bool include_raw) {
    auto container = encode(capture, include_raw);
    if (container.is_error()) {
        return Result<std::string>::error(container.error_category(), container.error_message());
    }
    return container.value().serialize();
}

} // namespace webcapture
