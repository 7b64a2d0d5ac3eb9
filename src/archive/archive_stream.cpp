#include <dockhand/archive/archive_stream.h>

#include <algorithm>

namespace dockhand::archive {

ArchiveStream::ArchiveStream(std::string bytes, Compression compression, std::size_t entries,
                             std::size_t chunkSize)
    : state_(std::make_shared<State>()), compression_(compression), entries_(entries) {
    state_->bytes = std::move(bytes);
    state_->chunkSize = std::max<std::size_t>(chunkSize, 1);
}

std::optional<std::string> ArchiveStream::State::take() {
    if (offset >= bytes.size()) {
        return std::nullopt;
    }
    const auto n = std::min(chunkSize, bytes.size() - offset);
    std::string piece = bytes.substr(offset, n);
    offset += n;
    return piece;
}

std::optional<std::string> ArchiveStream::next() {
    return state_->take();
}

std::string ArchiveStream::readAll() {
    auto& s = *state_;
    std::string rest = s.bytes.substr(std::min(s.offset, s.bytes.size()));
    s.offset = s.bytes.size();
    return rest;
}

std::function<Result<std::optional<std::string>>()> ArchiveStream::toBodySource() const {
    return [state = state_]() -> Result<std::optional<std::string>> { return state->take(); };
}

} // namespace dockhand::archive
