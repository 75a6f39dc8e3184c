#pragma once

#include "archive/wacz_container.hpp"
#include "capture/capture.hpp"
#include "core/error.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace webcapture {

/**
 * @brief WACZ → Capture
 *
 * The rebuilt capture is COMPLETE, its url is the package's
 * mainPageUrl, and its exchanges, generated exchanges and provenance
 * equal those of the capture that was encoded. Logs are not archived.
 */
class ArchiveDecoder {
public:
    [[nodiscard]] static Result<std::unique_ptr<Capture>> decode(std::string_view bytes);

    /// Read a .wacz file from disk and decode it
    [[nodiscard]] static Result<std::unique_ptr<Capture>> decode_file(const std::string& path);

    /// Rebuild from an already parsed container
    [[nodiscard]] static Result<std::unique_ptr<Capture>> from_container(
        const WaczContainer& container);
};

} // namespace webcapture
