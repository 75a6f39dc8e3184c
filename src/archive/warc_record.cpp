#include "archive/warc_record.hpp"
#include "core/utils.hpp"

namespace webcapture {

std::optional<std::string> WarcRecord::field(std::string_view name) const {
    for (const auto& [key, value] : fields) {
        if (utils::iequals(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

namespace warc {

std::string new_record_id() {
    return "<urn:uuid:" + utils::generate_uuid() + ">";
}

std::string serialize(const WarcRecord& record) {
    std::string out;
    out.reserve(record.block.size() + 512);

    out += record.version;
    out += "\r\n";
    for (const auto& [name, value] : record.fields) {
        if (utils::iequals(name, "Content-Length")) {
            continue;
        }
        out += name;
        out += ": ";
        out += value;
        out += "\r\n";
    }
    out += "Content-Length: ";
    out += std::to_string(record.block.size());
    out += "\r\n\r\n";
    out += record.block;
    out += "\r\n\r\n";
    return out;
}

} // namespace warc

} // namespace webcapture
