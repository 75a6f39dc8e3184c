#include "capture/capture.hpp"
#include "config/options_loader.hpp"

namespace webcapture {

Capture::Capture(std::string url, CaptureOptions options)
    : url_(std::move(url)), options_(std::move(options)) {}

Result<std::unique_ptr<Capture>> Capture::create(const std::string& url, CaptureOptions options) {
    auto validated = validate_url(url);
    if (validated.is_error()) {
        return Result<std::unique_ptr<Capture>>::error(
            validated.error_category(), validated.error_message());
    }
    return Result<std::unique_ptr<Capture>>::ok(
        std::unique_ptr<Capture>(new Capture(std::move(validated.value()), std::move(options))));
}

std::vector<GeneratedExchange> Capture::generated_exchanges() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generated_;
}

std::vector<LogEntry> Capture::logs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return logs_;
}

std::optional<nlohmann::json> Capture::provenance_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return provenance_info_;
}

void Capture::add_log(std::string message, bool is_warning, std::string trace,
                      ErrorCategory category) {
    if (options_.verbose) {
        const std::string line = trace.empty() ? message : message + ": " + trace;
        if (is_warning) {
            utils::log::warn(line);
        } else {
            utils::log::info(line);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    logs_.push_back(LogEntry{
        .timestamp = utils::now_ms(),
        .message = std::move(message),
        .is_warning = is_warning,
        .trace = std::move(trace),
        .category = category,
    });
}

void Capture::add_generated_exchange(GeneratedExchange exchange) {
    if (exchange.id.empty()) {
        exchange.id = utils::generate_uuid();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    generated_.push_back(std::move(exchange));
}

void Capture::set_provenance_info(nlohmann::json info) {
    std::lock_guard<std::mutex> lock(mutex_);
    provenance_info_ = std::move(info);
}

} // namespace webcapture
