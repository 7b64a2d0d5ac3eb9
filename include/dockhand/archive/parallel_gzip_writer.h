#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

#include <dockhand/core/types.h>

namespace dockhand::archive {

// Compresses one chunk into a complete gzip member. Called concurrently from worker
// threads; `index` is the chunk's position in the input.
using ChunkCompressor = std::function<Result<std::string>(std::string_view chunk,
                                                          std::size_t index)>;

/**
 * @brief Multi-member gzip encoder that compresses fixed-size chunks in parallel
 *
 * Chunks are tagged with their index when submitted to a bounded boost::asio::thread_pool.
 * Results are collected by index and appended strictly in index order, so the output is
 * the same regardless of which worker finishes first. At most 2 * workers chunks are in
 * flight at once.
 */
class ParallelGzipWriter {
public:
    ParallelGzipWriter(std::size_t workers, std::size_t chunkSize, int level);
    ParallelGzipWriter(std::size_t workers, std::size_t chunkSize, ChunkCompressor compressor);

    /**
     * @brief Compress the whole input
     * @return Concatenated gzip members, or the first chunk error in index order
     */
    [[nodiscard]] Result<std::string> compress(std::string_view data) const;

    [[nodiscard]] std::size_t workers() const noexcept { return workers_; }
    [[nodiscard]] std::size_t chunkSize() const noexcept { return chunkSize_; }

private:
    std::size_t workers_;
    std::size_t chunkSize_;
    ChunkCompressor compressor_;
};

} // namespace dockhand::archive
