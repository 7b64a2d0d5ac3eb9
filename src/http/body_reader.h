#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/parser.hpp>

#include <dockhand/core/types.h>
#include <dockhand/transport/transport_stream.h>

namespace dockhand::http::detail {

class StreamPool;

// Owns the socket and parser state of a response whose body is still unread.
class BodyReader {
public:
    using Parser = boost::beast::http::response_parser<boost::beast::http::buffer_body>;

    BodyReader(transport::TransportStream stream, std::weak_ptr<StreamPool> pool,
               std::chrono::milliseconds readTimeout);
    ~BodyReader();

    BodyReader(const BodyReader&) = delete;
    BodyReader& operator=(const BodyReader&) = delete;

    boost::asio::awaitable<Result<std::optional<std::string>>> next();

    // Called once the parser reports the message complete.
    void finish();
    // Drops the socket without draining it.
    void abandon() noexcept;
    // Gives up ownership of the socket, for protocol upgrades.
    transport::TransportStream detach() noexcept;

    bool done() const noexcept { return done_; }
    std::optional<std::uint64_t> contentLength() const;

    Parser& parser() noexcept { return parser_; }
    boost::beast::flat_buffer& buffer() noexcept { return buffer_; }
    transport::TransportStream& stream() noexcept { return stream_; }

private:
    transport::TransportStream stream_;
    boost::beast::flat_buffer buffer_;
    Parser parser_;
    std::vector<char> scratch_;
    std::weak_ptr<StreamPool> pool_;
    std::chrono::milliseconds readTimeout_;
    std::optional<Error> failed_;
    bool done_{false};
    bool released_{false};
};

} // namespace dockhand::http::detail
