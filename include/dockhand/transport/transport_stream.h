#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <variant>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>

#if DOCKHAND_HAS_TLS
#include <boost/asio/ssl/stream.hpp>
#endif

namespace dockhand::transport {

// One concrete duplex byte stream over whichever transport the connector opened.
//
// Satisfies the Asio AsyncReadStream/AsyncWriteStream requirements so Beast can frame HTTP
// on top of it; dispatch to the underlying socket is a std::visit, not a virtual call.
// Copies share the same socket. The socket is closed when the last copy goes away.
class TransportStream {
public:
    using executor_type = boost::asio::any_io_executor;
    using unix_socket = boost::asio::local::stream_protocol::socket;
    using tcp_socket = boost::asio::ip::tcp::socket;
#if DOCKHAND_HAS_TLS
    using tls_stream = boost::asio::ssl::stream<tcp_socket>;
#endif

    enum class Kind { Unix, Tcp, Tls };

    explicit TransportStream(std::unique_ptr<unix_socket> socket);
    explicit TransportStream(std::unique_ptr<tcp_socket> socket);
#if DOCKHAND_HAS_TLS
    explicit TransportStream(std::unique_ptr<tls_stream> stream);
#endif

    executor_type get_executor() const { return state_->executor; }

    template <typename MutableBufferSequence, typename ReadToken>
    auto async_read_some(const MutableBufferSequence& buffers, ReadToken&& token) {
        return boost::asio::async_initiate<ReadToken,
                                           void(boost::system::error_code, std::size_t)>(
            [state = state_](auto handler, const MutableBufferSequence& b) {
                std::visit([&](auto& s) { s->async_read_some(b, std::move(handler)); },
                           state->stream);
            },
            token, buffers);
    }

    template <typename ConstBufferSequence, typename WriteToken>
    auto async_write_some(const ConstBufferSequence& buffers, WriteToken&& token) {
        return boost::asio::async_initiate<WriteToken,
                                           void(boost::system::error_code, std::size_t)>(
            [state = state_](auto handler, const ConstBufferSequence& b) {
                std::visit([&](auto& s) { s->async_write_some(b, std::move(handler)); },
                           state->stream);
            },
            token, buffers);
    }

    Kind kind() const noexcept;
    bool isOpen() const noexcept;
    // Closes the socket; pending operations complete with operation_aborted.
    void close() noexcept;

    // Arms a deadline; when it fires the socket is closed and timedOut() turns true.
    void expiresAfter(std::chrono::milliseconds timeout);
    void expiresNever();
    bool timedOut() const noexcept { return state_->expired; }

    unix_socket* unixSocket() noexcept;
    tcp_socket* tcpSocket() noexcept;
#if DOCKHAND_HAS_TLS
    tls_stream* tlsStream() noexcept;
#endif

private:
    struct State {
        executor_type executor;
#if DOCKHAND_HAS_TLS
        std::variant<std::unique_ptr<unix_socket>, std::unique_ptr<tcp_socket>,
                     std::unique_ptr<tls_stream>>
            stream;
#else
        std::variant<std::unique_ptr<unix_socket>, std::unique_ptr<tcp_socket>> stream;
#endif
        boost::asio::steady_timer deadline;
        std::uint64_t generation{0};
        bool expired{false};

        template <typename S>
        State(executor_type ex, std::unique_ptr<S> s)
            : executor(std::move(ex)), stream(std::move(s)), deadline(executor) {}
        ~State();

        void closeSocket() noexcept;
    };

    std::shared_ptr<State> state_;
};

} // namespace dockhand::transport
