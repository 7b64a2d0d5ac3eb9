#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <dockhand/archive/archive_options.h>
#include <dockhand/core/types.h>

namespace dockhand::archive {

// Finished build context, handed out in fixed-size pieces.
class ArchiveStream {
public:
    ArchiveStream(std::string bytes, Compression compression, std::size_t entries,
                  std::size_t chunkSize = DEFAULT_BUFFER_SIZE);

    // Next piece, std::nullopt at the end.
    std::optional<std::string> next();
    // Remaining bytes from the current position.
    std::string readAll();
    void rewind() noexcept { state_->offset = 0; }

    // Pull source for a streaming (chunked) request body. Shares the stream position.
    std::function<Result<std::optional<std::string>>()> toBodySource() const;

    std::size_t size() const noexcept { return state_->bytes.size(); }
    std::size_t entryCount() const noexcept { return entries_; }
    Compression compression() const noexcept { return compression_; }
    // The daemon sniffs gzip itself, so every mode uploads as application/x-tar.
    const char* contentType() const noexcept { return "application/x-tar"; }

private:
    struct State {
        std::string bytes;
        std::size_t offset{0};
        std::size_t chunkSize{DEFAULT_BUFFER_SIZE};

        std::optional<std::string> take();
    };
    std::shared_ptr<State> state_;
    Compression compression_;
    std::size_t entries_;
};

} // namespace dockhand::archive
