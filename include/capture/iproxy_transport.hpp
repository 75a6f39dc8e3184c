#pragma once

#include "capture/exchange.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace webcapture {

struct ProxyEndpoint {
    std::string host;
    uint16_t port = 0;
    bool verbose = false;

    [[nodiscard]] std::string url() const {
        return "http://" + host + ":" + std::to_string(port);
    }
};

/**
 * @brief Called for every byte segment the proxy observes
 *
 * session_id identifies the logical connection. The returned bytes are
 * what the transport forwards (the capture returns the chunk unchanged).
 */
using ChunkHandler = std::function<std::string_view(
    const std::string& session_id, Direction direction, std::string_view chunk)>;

/**
 * @brief TLS-terminating intercepting proxy
 *
 * Implementations may call the handler from any number of threads.
 */
class IProxyTransport {
public:
    virtual ~IProxyTransport() = default;

    /**
     * @brief Bind and begin delivering chunks
     * @throws std::exception if the endpoint cannot be bound
     */
    virtual void start(const ProxyEndpoint& endpoint, ChunkHandler handler) = 0;

    /// Stop accepting connections. Safe to call from any thread, including
    /// one that is not the delivery thread, while chunks are in flight.
    virtual void stop() = 0;
};

} // namespace webcapture
