#pragma once

#include "archive/wacz_container.hpp"
#include "capture/capture.hpp"
#include "core/error.hpp"

#include <string>

namespace webcapture {

/**
 * @brief Capture → WARC / WACZ
 *
 * Only captures in PARTIAL or COMPLETE state can be archived; anything
 * else is an ENCODE_ERROR. Reads the capture, never mutates it.
 */
class ArchiveEncoder {
public:
    /**
     * @brief Build the WACZ container model
     *
     * Pages: the first exchange (the crawl's entry page) followed by
     * every generated entry-point exchange in generation order.
     * Raw payloads are added under raw/ when include_raw is set.
     */
    [[nodiscard]] static Result<WaczContainer> encode(const Capture& capture, bool include_raw);

    /// encode() + WaczContainer::serialize()
    [[nodiscard]] static Result<std::string> to_wacz(const Capture& capture, bool include_raw);

    /**
     * @brief The capture's WARC file
     *
     * warcinfo, then request/response records per exchange in store
     * order, then generated exchanges. gzip = one member per record.
     */
    [[nodiscard]] static Result<std::string> to_warc(const Capture& capture, bool gzip = false);
};

} // namespace webcapture
