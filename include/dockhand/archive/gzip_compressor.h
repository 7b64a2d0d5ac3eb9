#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <dockhand/core/types.h>

namespace dockhand::archive {

/**
 * @brief Gzip (RFC 1952) encoder/decoder on top of zlib
 *
 * Each compress() call produces one complete gzip member. Concatenated members form a
 * valid multi-member gzip stream, which is what parallel compression relies on.
 * Instances hold no zlib state between calls and may be shared across threads.
 * Input is handed to zlib in slices of at most sliceSize bytes (0 selects the largest
 * count zlib accepts in one call), so inputs beyond 4 GiB are encoded whole.
 */
class GzipCompressor {
public:
    explicit GzipCompressor(int level = 9, std::size_t sliceSize = 0);

    /**
     * @brief Compress data into one gzip member
     * @return Compressed bytes or ErrorCode::ArchiveError
     */
    [[nodiscard]] Result<std::string> compress(std::string_view data) const;

    /**
     * @brief Decompress a gzip stream, concatenating every member
     * @param data Gzip bytes
     * @param limit Maximum decompressed size (0 for none)
     * @param sliceSize Input bytes per inflate call (0 for the zlib maximum)
     */
    [[nodiscard]] static Result<std::string>
    decompress(std::string_view data, std::size_t limit = 0, std::size_t sliceSize = 0);

    [[nodiscard]] int level() const noexcept { return level_; }
    [[nodiscard]] std::size_t sliceSize() const noexcept { return sliceSize_; }

private:
    int level_;
    std::size_t sliceSize_;
};

} // namespace dockhand::archive
