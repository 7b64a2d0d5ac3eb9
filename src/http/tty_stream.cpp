#include <dockhand/core/failure.h>
#include <dockhand/http/tty_stream.h>

#include <spdlog/spdlog.h>

namespace dockhand::http {

using boost::asio::awaitable;

Result<TtyFrameHeader> parseTtyFrameHeader(std::string_view header) {
    if (header.size() < kTtyHeaderSize) {
        return makeFailure(ErrorCode::Serialization, FailureKind::MalformedFrame,
                           fmt::format("TTY frame header needs {} bytes, got {}", kTtyHeaderSize,
                                       header.size()));
    }
    const auto id = static_cast<std::uint8_t>(header[0]);
    if (id > static_cast<std::uint8_t>(TtyChannel::Stderr)) {
        return makeFailure(ErrorCode::Serialization, FailureKind::MalformedFrame,
                           fmt::format("Invalid TTY stream id {}", id));
    }
    std::uint32_t length = 0;
    for (std::size_t i = 4; i < kTtyHeaderSize; ++i) {
        length = (length << 8) | static_cast<std::uint8_t>(header[i]);
    }
    return TtyFrameHeader{static_cast<TtyChannel>(id), length};
}

TtyStream TtyStream::multiplexed(BodyStream body) {
    return TtyStream(Source(std::in_place_type<BodyStream>, std::move(body)), false);
}

TtyStream TtyStream::multiplexed(UpgradedStream stream) {
    return TtyStream(Source(std::in_place_type<UpgradedStream>, std::move(stream)), false);
}

TtyStream TtyStream::raw(BodyStream body) {
    return TtyStream(Source(std::in_place_type<BodyStream>, std::move(body)), true);
}

TtyStream TtyStream::raw(UpgradedStream stream) {
    return TtyStream(Source(std::in_place_type<UpgradedStream>, std::move(stream)), true);
}

awaitable<Result<std::optional<std::string>>> TtyStream::pull() {
    if (auto* body = std::get_if<BodyStream>(&source_)) {
        co_return co_await body->next();
    }
    co_return co_await std::get<UpgradedStream>(source_).read();
}

awaitable<Result<std::optional<TtyChunk>>> TtyStream::next() {
    if (raw_) {
        if (sourceDone_) {
            co_return std::optional<TtyChunk>{};
        }
        for (;;) {
            auto chunk = co_await pull();
            if (!chunk) {
                co_return chunk.error();
            }
            if (!chunk.value()) {
                sourceDone_ = true;
                co_return std::optional<TtyChunk>{};
            }
            if (chunk.value()->empty()) {
                continue;
            }
            co_return std::optional<TtyChunk>(
                TtyChunk{TtyChannel::Stdout, std::move(*chunk.value())});
        }
    }

    for (;;) {
        if (buffer_.size() >= kTtyHeaderSize) {
            auto header = parseTtyFrameHeader(std::string_view(buffer_).substr(0, kTtyHeaderSize));
            if (!header) {
                co_return header.error();
            }
            const std::size_t frameSize = kTtyHeaderSize + header.value().length;
            if (buffer_.size() >= frameSize) {
                TtyChunk out{header.value().channel,
                             buffer_.substr(kTtyHeaderSize, header.value().length)};
                buffer_.erase(0, frameSize);
                co_return std::optional<TtyChunk>(std::move(out));
            }
        }

        if (sourceDone_) {
            if (buffer_.empty()) {
                co_return std::optional<TtyChunk>{};
            }
            co_return makeFailure(ErrorCode::Io, FailureKind::Reset,
                                  fmt::format("TTY stream ended inside a frame ({} bytes pending)",
                                              buffer_.size()));
        }

        auto chunk = co_await pull();
        if (!chunk) {
            co_return chunk.error();
        }
        if (!chunk.value()) {
            sourceDone_ = true;
            continue;
        }
        buffer_ += *chunk.value();
    }
}

awaitable<Result<void>> TtyStream::writeStdin(std::string_view data) {
    auto* upgraded = std::get_if<UpgradedStream>(&source_);
    if (!upgraded) {
        co_return makeFailure(ErrorCode::Io, FailureKind::NotUpgraded,
                              "stdin is only writable on an upgraded stream");
    }
    co_return co_await upgraded->write(data);
}

} // namespace dockhand::http
