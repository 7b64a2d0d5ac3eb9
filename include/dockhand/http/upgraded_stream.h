#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <utility>
#include <boost/asio/awaitable.hpp>

#include <dockhand/core/types.h>
#include <dockhand/transport/transport_stream.h>

namespace dockhand::http {

// Raw duplex byte stream left over after a 101 Switching Protocols response (attach, exec).
// Owns the socket; it is closed when the stream is destroyed.
class UpgradedStream {
public:
    UpgradedStream(transport::TransportStream stream, std::string buffered);

    // Next bytes from the daemon, std::nullopt once the daemon closes its side.
    boost::asio::awaitable<Result<std::optional<std::string>>> read();
    boost::asio::awaitable<Result<void>> write(std::string_view data);
    // Half-closes the sending side so the daemon sees end of input.
    Result<void> closeWrite();
    void close() noexcept { stream_.close(); }

    transport::TransportStream& transport() noexcept { return stream_; }

private:
    transport::TransportStream stream_;
    std::string buffered_;
    std::vector<char> scratch_;
    bool eof_{false};
};

} // namespace dockhand::http
