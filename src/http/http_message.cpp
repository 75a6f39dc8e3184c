#include "http/http_message.hpp"
#include "core/utils.hpp"

#include <format>

namespace webcapture {

std::optional<std::string> HttpMessage::header(std::string_view name) const {
    for (const auto& [key, value] : headers) {
        if (utils::iequals(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

namespace http {

namespace {

constexpr std::string_view kCrlf = "\r\n";
constexpr std::string_view kHeadTerminator = "\r\n\r\n";

// "HTTP/1.1" -> (1, 1)
bool parse_version(std::string_view token, int& major, int& minor) {
    if (token.size() != 8 || token.substr(0, 5) != "HTTP/" || token[6] != '.') {
        return false;
    }
    const char ma = token[5];
    const char mi = token[7];
    if (ma < '0' || ma > '9' || mi < '0' || mi > '9') return false;
    major = ma - '0';
    minor = mi - '0';
    return true;
}

bool parse_header_lines(std::string_view block, HeaderList& headers) {
    while (!block.empty()) {
        const size_t eol = block.find(kCrlf);
        const std::string_view line = block.substr(0, eol);
        block = (eol == std::string_view::npos) ? std::string_view{} : block.substr(eol + 2);

        const size_t colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return false;
        }
        std::string_view value = line.substr(colon + 1);
        const size_t first = value.find_first_not_of(" \t");
        value = (first == std::string_view::npos) ? std::string_view{} : value.substr(first);
        headers.emplace_back(std::string(line.substr(0, colon)), std::string(value));
    }
    return true;
}

struct Head {
    std::string_view start_line;
    std::string_view header_block;
    std::string_view body;
};

std::optional<Head> split_head(std::string_view raw) {
    const size_t end = raw.find(kHeadTerminator);
    if (end == std::string_view::npos) return std::nullopt;

    Head head;
    const std::string_view block = raw.substr(0, end);
    const size_t first_eol = block.find(kCrlf);
    if (first_eol == std::string_view::npos) {
        head.start_line = block;
    } else {
        head.start_line = block.substr(0, first_eol);
        head.header_block = block.substr(first_eol + 2);
    }
    head.body = raw.substr(end + kHeadTerminator.size());
    return head;
}

} // anonymous namespace

std::string serialize(const HttpMessage& message) {
    std::string out;
    out.reserve(128 + message.body.size());

    if (message.is_request()) {
        out += std::format("{} {} HTTP/{}.{}\r\n", message.method, message.target,
                           message.version_major, message.version_minor);
    } else {
        out += std::format("HTTP/{}.{} {} {}\r\n", message.version_major,
                           message.version_minor, message.status_code, message.status_message);
    }
    for (const auto& [name, value] : message.headers) {
        out += name;
        out += ": ";
        out += value;
        out += kCrlf;
    }
    out += kCrlf;
    out += message.body;
    return out;
}

std::optional<HttpMessage> parse_request(std::string_view raw) {
    const auto head = split_head(raw);
    if (!head) return std::nullopt;

    const std::string_view line = head->start_line;
    const size_t sp1 = line.find(' ');
    const size_t sp2 = line.rfind(' ');
    if (sp1 == std::string_view::npos || sp2 == sp1) return std::nullopt;

    HttpMessage msg;
    msg.method = std::string(line.substr(0, sp1));
    msg.target = std::string(line.substr(sp1 + 1, sp2 - sp1 - 1));
    if (msg.method.empty() || msg.target.empty() ||
        !parse_version(line.substr(sp2 + 1), msg.version_major, msg.version_minor)) {
        return std::nullopt;
    }
    if (!parse_header_lines(head->header_block, msg.headers)) return std::nullopt;
    msg.body = std::string(head->body);
    return msg;
}

std::optional<HttpMessage> parse_response(std::string_view raw) {
    const auto head = split_head(raw);
    if (!head) return std::nullopt;

    // "HTTP/1.1 200 OK" (reason phrase may be empty)
    const std::string_view line = head->start_line;
    if (line.size() < 12 || line[8] != ' ') return std::nullopt;

    HttpMessage msg;
    if (!parse_version(line.substr(0, 8), msg.version_major, msg.version_minor)) {
        return std::nullopt;
    }
    const auto code = utils::try_parse_int<int>(line.substr(9, 3));
    if (!code) return std::nullopt;
    msg.status_code = *code;
    if (line.size() > 12) {
        if (line[12] != ' ') return std::nullopt;
        msg.status_message = std::string(line.substr(13));
    }
    if (!parse_header_lines(head->header_block, msg.headers)) return std::nullopt;
    msg.body = std::string(head->body);
    return msg;
}

std::optional<std::string> request_url(std::string_view raw_request,
                                       std::string_view default_scheme) {
    const auto request = parse_request(raw_request);
    if (!request) return std::nullopt;

    const std::string lower_target = utils::to_lower(request->target);
    if (lower_target.starts_with("http://") || lower_target.starts_with("https://")) {
        return request->target;
    }
    if (utils::iequals(request->method, "CONNECT")) {
        return std::format("{}://{}/", default_scheme, request->target);
    }

    const auto host = request->header("Host");
    if (!host || host->empty() || !request->target.starts_with('/')) {
        return std::nullopt;
    }
    return std::format("{}://{}{}", default_scheme, *host, request->target);
}

} // namespace http

} // namespace webcapture
