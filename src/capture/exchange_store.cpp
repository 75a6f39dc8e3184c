#include "capture/exchange_store.hpp"

namespace webcapture {

std::optional<size_t> ExchangeStore::find_open(const std::string& session_id,
                                               Direction direction) const {
    const auto it = latest_by_session_.find(session_id);
    if (it == latest_by_session_.end()) {
        return std::nullopt;
    }
    const Exchange& latest = exchanges_[it->second];
    if (direction == Direction::RESPONSE || !latest.has_response()) {
        return it->second;
    }
    return std::nullopt;
}

size_t ExchangeStore::create(const std::string& session_id, utils::Timestamp timestamp) {
    Exchange exchange;
    exchange.id = session_id;
    exchange.timestamp = timestamp;
    exchanges_.push_back(std::move(exchange));

    const size_t index = exchanges_.size() - 1;
    latest_by_session_[session_id] = index;
    return index;
}

void ExchangeStore::append(size_t index, Direction direction, std::string_view bytes) {
    exchanges_.at(index).raw(direction).append(bytes);
    total_size_ += bytes.size();
}

void ExchangeStore::push_back(Exchange exchange) {
    total_size_ += exchange.request_raw.size() + exchange.response_raw.size();
    latest_by_session_[exchange.id] = exchanges_.size();
    exchanges_.push_back(std::move(exchange));
}

} // namespace webcapture
