#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <utility>
#include <boost/asio/awaitable.hpp>

#include <dockhand/core/types.h>
#include <dockhand/http/response.h>
#include <dockhand/http/upgraded_stream.h>

namespace dockhand::http {

enum class TtyChannel : std::uint8_t { Stdin = 0, Stdout = 1, Stderr = 2 };

struct TtyChunk {
    TtyChannel channel;
    std::string data;
};

inline constexpr std::size_t kTtyHeaderSize = 8;

struct TtyFrameHeader {
    TtyChannel channel;
    std::uint32_t length;
};

// Decodes the 8-byte frame header: byte 0 is the channel, bytes 4..7 the big-endian payload
// length. Unknown channels fail with ErrorCode::Serialization.
Result<TtyFrameHeader> parseTtyFrameHeader(std::string_view header);

// Demultiplexes the attach/logs stream format of non-TTY containers. In raw mode (TTY
// containers) every chunk is passed through as stdout.
class TtyStream {
public:
    static TtyStream multiplexed(BodyStream body);
    static TtyStream multiplexed(UpgradedStream stream);
    static TtyStream raw(BodyStream body);
    static TtyStream raw(UpgradedStream stream);

    // Next frame, std::nullopt when the source ends on a frame boundary. Ending inside a
    // frame fails with [stream:reset].
    boost::asio::awaitable<Result<std::optional<TtyChunk>>> next();

    // Writes to the container's stdin; only available over an upgraded stream.
    boost::asio::awaitable<Result<void>> writeStdin(std::string_view data);

    bool isRaw() const noexcept { return raw_; }

private:
    using Source = std::variant<BodyStream, UpgradedStream>;
    TtyStream(Source source, bool raw) : source_(std::move(source)), raw_(raw) {}

    boost::asio::awaitable<Result<std::optional<std::string>>> pull();

    Source source_;
    std::string buffer_;
    bool raw_;
    bool sourceDone_{false};
};

} // namespace dockhand::http
