#include "archive/archive_decoder.hpp"
#include "archive/archive_encoder.hpp"
#include "config/options_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>

using namespace webcapture;

namespace {

void print_usage() {
    std::cerr <<
        "Usage:\n"
        "  webcapture inspect <file.wacz>\n"
        "  webcapture warc <file.wacz> <out.warc|out.warc.gz>\n"
        "  webcapture check-config <options.toml>\n";
}

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

// =========================================================================
// inspect
// =========================================================================

int run_inspect(const std::string& path) {
    auto decoded = ArchiveDecoder::decode_file(path);
    if (decoded.is_error()) {
        utils::log::error(std::format("[{}] {}", error_category_name(decoded.error_category()),
                                      decoded.error_message()));
        return 1;
    }
    const Capture& capture = *decoded.value();

    std::cout << std::format("url:         {}\n", capture.url());
    std::cout << std::format("exchanges:   {}\n", capture.exchanges().size());
    std::cout << std::format("total size:  {} bytes\n", capture.total_size());

    for (const Exchange& exchange : capture.exchanges()) {
        const auto head = http::parse_response(exchange.response_raw);
        std::cout << std::format("  {}  {:>4}  {:>10}  {}\n",
            utils::format_iso8601(exchange.timestamp),
            head ? std::to_string(head->status_code) : "-",
            exchange.request_raw.size() + exchange.response_raw.size(),
            exchange.request_url().value_or("(unknown)"));
    }

    const auto generated = capture.generated_exchanges();
    std::cout << std::format("generated:   {}\n", generated.size());
    for (const GeneratedExchange& exchange : generated) {
        std::cout << std::format("  {}  {}{}  {}\n",
            utils::format_iso8601(exchange.timestamp), exchange.url,
            exchange.is_entry_point ? " (entry point)" : "", exchange.description);
    }

    if (auto provenance = capture.provenance_info()) {
        std::cout << "provenance:\n" << provenance->dump(2) << "\n";
    }
    return 0;
}

// =========================================================================
// warc
// =========================================================================

int run_warc(const std::string& input, const std::string& output) {
    auto decoded = ArchiveDecoder::decode_file(input);
    if (decoded.is_error()) {
        utils::log::error(std::format("[{}] {}", error_category_name(decoded.error_category()),
                                      decoded.error_message()));
        return 1;
    }

    const bool gzip = ends_with(output, ".gz");
    auto warc = ArchiveEncoder::to_warc(*decoded.value(), gzip);
    if (warc.is_error()) {
        utils::log::error(std::format("[{}] {}", error_category_name(warc.error_category()),
                                      warc.error_message()));
        return 1;
    }

    std::ofstream file(output, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        utils::log::error(std::format("Cannot open output file: {}", output));
        return 1;
    }
    file.write(warc.value().data(), static_cast<std::streamsize>(warc.value().size()));
    if (!file) {
        utils::log::error(std::format("Failed to write {}", output));
        return 1;
    }

    utils::log::info(std::format("Wrote {} ({} bytes, {} exchanges)", output,
                                 warc.value().size(), decoded.value()->exchanges().size()));
    return 0;
}

// =========================================================================
// check-config
// =========================================================================

int run_check_config(const std::string& path) {
    auto result = OptionsLoader::load_from_file(path);
    if (!result.success) {
        utils::log::error(result.error_message);
        return 1;
    }
    std::cout << options_to_json(result.options).dump(2) << "\n";
    utils::log::info(std::format("{}: OK", path));
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    try {
        const std::string_view command = argv[1];

        if (command == "inspect" && argc == 3) {
            return run_inspect(argv[2]);
        }
        if (command == "warc" && argc == 4) {
            return run_warc(argv[2], argv[3]);
        }
        if (command == "check-config" && argc == 3) {
            return run_check_config(argv[2]);
        }

        print_usage();
        return 1;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }
}
