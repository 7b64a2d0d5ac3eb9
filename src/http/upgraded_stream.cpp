#include <dockhand/http/upgraded_stream.h>

#include "../transport/error_mapping.h"

#include <boost/asio/buffer.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

namespace dockhand::http {

using boost::asio::awaitable;
using boost::asio::redirect_error;
using boost::asio::use_awaitable;

UpgradedStream::UpgradedStream(transport::TransportStream stream, std::string buffered)
    : stream_(std::move(stream)), buffered_(std::move(buffered)), scratch_(DEFAULT_BUFFER_SIZE) {}

awaitable<Result<std::optional<std::string>>> UpgradedStream::read() {
    if (!buffered_.empty()) {
        std::string out = std::move(buffered_);
        buffered_.clear();
        co_return std::optional<std::string>(std::move(out));
    }
    if (eof_) {
        co_return std::optional<std::string>{};
    }

    boost::system::error_code ec;
    auto n = co_await stream_.async_read_some(boost::asio::buffer(scratch_),
                                              redirect_error(use_awaitable, ec));
    if (ec == boost::asio::error::eof) {
        eof_ = true;
        if (n == 0) {
            co_return std::optional<std::string>{};
        }
    } else if (ec) {
        co_return transport::detail::exchangeFailure(ec, "upgraded stream read");
    }
    co_return std::optional<std::string>(std::string(scratch_.data(), n));
}

awaitable<Result<void>> UpgradedStream::write(std::string_view data) {
    boost::system::error_code ec;
    co_await boost::asio::async_write(stream_, boost::asio::buffer(data.data(), data.size()),
                                      redirect_error(use_awaitable, ec));
    if (ec) {
        co_return transport::detail::exchangeFailure(ec, "upgraded stream write");
    }
    co_return Result<void>();
}

Result<void> UpgradedStream::closeWrite() {
    boost::system::error_code ec;
    if (auto* local = stream_.unixSocket()) {
        local->shutdown(boost::asio::socket_base::shutdown_send, ec);
    } else if (auto* tcp = stream_.tcpSocket()) {
        tcp->shutdown(boost::asio::socket_base::shutdown_send, ec);
    } else {
        // TLS has no half-close; the peer sees the end of input when the stream closes.
        return Result<void>();
    }
    if (ec) {
        return transport::detail::exchangeFailure(ec, "upgraded stream shutdown");
    }
    return Result<void>();
}

} // namespace dockhand::http
