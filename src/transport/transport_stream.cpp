#include <dockhand/transport/transport_stream.h>

#include <spdlog/spdlog.h>

namespace dockhand::transport {

namespace {
template <typename S> auto& lowestLayer(S& s) {
    return s.lowest_layer();
}
} // namespace

TransportStream::TransportStream(std::unique_ptr<unix_socket> socket)
    : state_(std::make_shared<State>(socket->get_executor(), std::move(socket))) {}

TransportStream::TransportStream(std::unique_ptr<tcp_socket> socket)
    : state_(std::make_shared<State>(socket->get_executor(), std::move(socket))) {}

#if DOCKHAND_HAS_TLS
TransportStream::TransportStream(std::unique_ptr<tls_stream> stream)
    : state_(std::make_shared<State>(stream->get_executor(), std::move(stream))) {}
#endif

TransportStream::State::~State() {
    closeSocket();
}

void TransportStream::State::closeSocket() noexcept {
    std::visit(
        [](auto& s) {
            if (!s)
                return;
            auto& sock = lowestLayer(*s);
            if (!sock.is_open())
                return;
            boost::system::error_code ec;
            sock.shutdown(boost::asio::socket_base::shutdown_both, ec);
            sock.close(ec);
            if (ec) {
                spdlog::warn("TransportStream close failed: {}", ec.message());
            }
        },
        stream);
}

TransportStream::Kind TransportStream::kind() const noexcept {
    switch (state_->stream.index()) {
        case 0:
            return Kind::Unix;
        case 1:
            return Kind::Tcp;
        default:
            return Kind::Tls;
    }
}

bool TransportStream::isOpen() const noexcept {
    return std::visit([](const auto& s) { return s && lowestLayer(*s).is_open(); },
                      state_->stream);
}

void TransportStream::close() noexcept {
    state_->deadline.cancel();
    state_->closeSocket();
}

void TransportStream::expiresAfter(std::chrono::milliseconds timeout) {
    auto generation = ++state_->generation;
    state_->expired = false;
    state_->deadline.expires_after(timeout);
    std::weak_ptr<State> weak = state_;
    state_->deadline.async_wait([weak, generation](const boost::system::error_code& ec) {
        if (ec)
            return;
        auto state = weak.lock();
        if (!state || state->generation != generation)
            return;
        spdlog::debug("TransportStream deadline expired, closing socket");
        state->expired = true;
        state->closeSocket();
    });
}

void TransportStream::expiresNever() {
    ++state_->generation;
    state_->deadline.cancel();
}

TransportStream::unix_socket* TransportStream::unixSocket() noexcept {
    auto* p = std::get_if<std::unique_ptr<unix_socket>>(&state_->stream);
    return p ? p->get() : nullptr;
}

TransportStream::tcp_socket* TransportStream::tcpSocket() noexcept {
    auto* p = std::get_if<std::unique_ptr<tcp_socket>>(&state_->stream);
    return p ? p->get() : nullptr;
}

#if DOCKHAND_HAS_TLS
TransportStream::tls_stream* TransportStream::tlsStream() noexcept {
    auto* p = std::get_if<std::unique_ptr<tls_stream>>(&state_->stream);
    return p ? p->get() : nullptr;
}
#endif

} // namespace dockhand::transport
