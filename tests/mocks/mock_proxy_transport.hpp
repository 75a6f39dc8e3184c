#pragma once

#include "capture/iproxy_transport.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

namespace webcapture::testing {

/**
 * @brief Observable state shared between a test and its MockProxyTransport
 *
 * The controller owns the transport; the test keeps this.
 */
struct MockProxyState {
    bool fail_start = false;

    std::mutex mutex;
    ChunkHandler handler;
    std::optional<ProxyEndpoint> endpoint;

    std::atomic<int> start_count{0};
    std::atomic<int> stop_count{0};

    /// Push one chunk through the capture's handler, as the proxy would
    std::string_view deliver(const std::string& session_id, Direction direction,
                             std::string_view chunk) {
        ChunkHandler current;
        {
            std::lock_guard<std::mutex> lock(mutex);
            current = handler;
        }
        if (!current) {
            throw std::logic_error("proxy not started");
        }
        return current(session_id, direction, chunk);
    }
};

/**
 * @brief Mock proxy: records start/stop, lets tests inject traffic
 */
class MockProxyTransport : public IProxyTransport {
public:
    explicit MockProxyTransport(std::shared_ptr<MockProxyState> state)
        : state_(std::move(state)) {}

    void start(const ProxyEndpoint& endpoint, ChunkHandler handler) override {
        if (state_->fail_start) {
            throw std::runtime_error("bind failed: address already in use");
        }
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->endpoint = endpoint;
            state_->handler = std::move(handler);
        }
        state_->start_count.fetch_add(1);
    }

    void stop() override {
        state_->stop_count.fetch_add(1);
    }

private:
    std::shared_ptr<MockProxyState> state_;
};

} // namespace webcapture::testing
