#include <dockhand/archive/archive_options.h>
#include <dockhand/archive/gzip_compressor.h>
#include <dockhand/archive/parallel_gzip_writer.h>
#include <dockhand/core/failure.h>

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <map>
#include <mutex>
#include <optional>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <spdlog/spdlog.h>

namespace dockhand::archive {

namespace {

// Completed chunks keyed by index; the writer drains them in index order.
struct CompletionBoard {
    std::mutex mutex;
    std::condition_variable cv;
    std::map<std::size_t, Result<std::string>> done;

    void put(std::size_t index, Result<std::string> result) {
        {
            std::lock_guard<std::mutex> lk(mutex);
            done.emplace(index, std::move(result));
        }
        cv.notify_all();
    }

    Result<std::string> take(std::size_t index) {
        std::unique_lock<std::mutex> lk(mutex);
        cv.wait(lk, [&] { return done.find(index) != done.end(); });
        auto node = done.extract(index);
        return std::move(node.mapped());
    }
};

} // namespace

ParallelGzipWriter::ParallelGzipWriter(std::size_t workers, std::size_t chunkSize, int level)
    : ParallelGzipWriter(workers, chunkSize,
                         [gzip = GzipCompressor(level)](std::string_view chunk, std::size_t) {
                             return gzip.compress(chunk);
                         }) {}

ParallelGzipWriter::ParallelGzipWriter(std::size_t workers, std::size_t chunkSize,
                                       ChunkCompressor compressor)
    : workers_(std::clamp<std::size_t>(workers, 1, kMaxCompressionWorkers)),
      chunkSize_(std::max(chunkSize, MIN_ARCHIVE_CHUNK_SIZE)),
      compressor_(std::move(compressor)) {}

Result<std::string> ParallelGzipWriter::compress(std::string_view data) const {
    const std::size_t chunks = data.empty() ? 1 : (data.size() + chunkSize_ - 1) / chunkSize_;
    const std::size_t maxInFlight = workers_ * 2;

    CompletionBoard board;
    boost::asio::thread_pool pool(workers_);
    std::string out;
    std::optional<Error> failure;

    std::size_t submitted = 0;
    std::size_t emitted = 0;
    auto submit = [&](std::size_t index) {
        auto chunk = data.substr(index * chunkSize_, chunkSize_);
        boost::asio::post(pool, [&board, this, chunk, index] {
            // An exception escaping a pool thread terminates; report it as the chunk result.
            try {
                board.put(index, compressor_(chunk, index));
            } catch (const std::exception& e) {
                board.put(index, makeFailure(ErrorCode::ArchiveError, FailureKind::ArchiveIo,
                                             fmt::format("Compressing chunk {} threw", index),
                                             e.what()));
            } catch (...) {
                board.put(index, makeFailure(ErrorCode::ArchiveError, FailureKind::ArchiveIo,
                                             fmt::format("Compressing chunk {} threw", index),
                                             "unknown exception"));
            }
        });
    };

    spdlog::debug("ParallelGzipWriter: {} bytes in {} chunks on {} workers", data.size(), chunks,
                  workers_);
    while (emitted < chunks) {
        while (submitted < chunks && submitted - emitted < maxInFlight && !failure) {
            submit(submitted++);
        }
        if (emitted == submitted) {
            break;
        }
        auto member = board.take(emitted++);
        if (failure) {
            continue;
        }
        if (!member) {
            failure = member.error();
            continue;
        }
        out += member.value();
    }

    pool.join();
    if (failure) {
        return *failure;
    }
    return out;
}

} // namespace dockhand::archive
