#pragma once

#include <algorithm>
#include <cstddef>
#include <thread>

#include <dockhand/core/types.h>

namespace dockhand::archive {

inline constexpr std::size_t kMaxCompressionWorkers = 64;
inline constexpr int kDefaultGzipLevel = 9;

enum class Compression {
    None,     ///< plain tar
    Serial,   ///< one gzip member
    Parallel, ///< one gzip member per chunk, compressed concurrently
};

struct ArchiveOptions {
    Compression compression{Compression::Serial};
    int level{kDefaultGzipLevel};
    // Parallel mode input chunk size.
    std::size_t chunkSize{DEFAULT_ARCHIVE_CHUNK_SIZE};
    // 0 picks the hardware concurrency.
    std::size_t workers{0};
    bool followSymlinks{false};

    std::size_t effectiveWorkers() const {
        std::size_t n = workers ? workers : std::thread::hardware_concurrency();
        return std::clamp<std::size_t>(n, 1, kMaxCompressionWorkers);
    }

    std::size_t effectiveChunkSize() const {
        return std::max(chunkSize, MIN_ARCHIVE_CHUNK_SIZE);
    }
};

} // namespace dockhand::archive
