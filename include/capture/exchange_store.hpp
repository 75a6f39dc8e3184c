#pragma once

#include "capture/exchange.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace webcapture {

/**
 * @brief Ordered exchanges of one capture plus the running byte total
 *
 * Exchanges are kept in creation order (first byte arrival). Indexes
 * are stable: exchanges are only appended, never removed.
 *
 * Not thread-safe; ExchangeAssembler serializes access.
 */
class ExchangeStore {
public:
    ExchangeStore() = default;

    /**
     * @brief Most recent exchange for a session that accepts this chunk
     *
     * Responses always extend the most recent exchange of the session.
     * Requests extend it only while it has no response bytes yet.
     * Only the most recent exchange of a session can lack a response,
     * so the per-session index is equivalent to a backwards scan.
     *
     * @return index, or nullopt when a new exchange must be created
     */
    [[nodiscard]] std::optional<size_t> find_open(const std::string& session_id,
                                                  Direction direction) const;

    /// Append a new exchange for session_id; returns its index
    size_t create(const std::string& session_id, utils::Timestamp timestamp);

    /// Append bytes to one direction of an exchange and account them
    void append(size_t index, Direction direction, std::string_view bytes);

    /// Append a fully built exchange (decoder); accounts its raw bytes
    void push_back(Exchange exchange);

    [[nodiscard]] const std::vector<Exchange>& exchanges() const { return exchanges_; }
    [[nodiscard]] const Exchange& at(size_t index) const { return exchanges_.at(index); }
    [[nodiscard]] size_t size() const { return exchanges_.size(); }
    [[nodiscard]] bool empty() const { return exchanges_.empty(); }

    /// Sum of every byte ever appended; never decreases
    [[nodiscard]] uint64_t total_size() const { return total_size_; }

private:
    std::vector<Exchange> exchanges_;
    std::unordered_map<std::string, size_t> latest_by_session_;
    uint64_t total_size_ = 0;
};

} // namespace webcapture
