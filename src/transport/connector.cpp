#include <dockhand/core/failure.h>
#include <dockhand/transport/connector.h>

#include "error_mapping.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#if DOCKHAND_HAS_TLS
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <openssl/ssl.h>
#endif

#include <spdlog/spdlog.h>
#include <filesystem>
#include <string>

namespace dockhand::transport {

using boost::asio::awaitable;
using boost::asio::redirect_error;
using boost::asio::use_awaitable;
using tcp = boost::asio::ip::tcp;

//-----------------------------------------------------------------------------
// UnixConnector
//-----------------------------------------------------------------------------

UnixConnector::UnixConnector(boost::asio::any_io_executor executor, Endpoint endpoint)
    : executor_(std::move(executor)), endpoint_(std::move(endpoint)) {}

awaitable<Result<TransportStream>> UnixConnector::connect(std::chrono::milliseconds timeout) {
    const auto& path = endpoint_.unixSocket().path;

    std::error_code fsEc;
    auto status = std::filesystem::status(path, fsEc);
    if (!std::filesystem::exists(status)) {
        std::string msg = "Daemon socket not found at '" + path.string() + "'";
        spdlog::debug("UnixConnector preflight: {}", msg);
        co_return makeFailure(ErrorCode::ConnectionFailed, FailureKind::SocketMissing, msg,
                              fsEc ? fsEc.message() : std::string{});
    }
    if (status.type() != std::filesystem::file_type::socket) {
        std::string msg = "Path exists but is not a socket: '" + path.string() + "'";
        spdlog::debug("UnixConnector preflight: {}", msg);
        co_return makeFailure(ErrorCode::ConnectionFailed, FailureKind::PathNotSocket, msg);
    }

    auto socket = std::make_unique<TransportStream::unix_socket>(executor_);
    auto* raw = socket.get();
    TransportStream stream(std::move(socket));
    if (timeout.count() > 0) {
        stream.expiresAfter(timeout);
    }

    boost::system::error_code ec;
    co_await raw->async_connect(boost::asio::local::stream_protocol::endpoint(path.string()),
                                redirect_error(use_awaitable, ec));
    stream.expiresNever();

    if (stream.timedOut()) {
        co_return detail::timeoutFailure("Connect", path.string());
    }
    if (ec) {
        co_return detail::connectFailure(ec, path.string());
    }
    spdlog::debug("UnixConnector connected to {}", path.string());
    co_return stream;
}

//-----------------------------------------------------------------------------
// TcpConnector
//-----------------------------------------------------------------------------

TcpConnector::TcpConnector(boost::asio::any_io_executor executor, Endpoint endpoint)
    : executor_(std::move(executor)), endpoint_(std::move(endpoint)) {}

awaitable<Result<std::unique_ptr<tcp::socket>>>
TcpConnector::connectSocket(std::chrono::milliseconds timeout) {
    const auto& target = endpoint_.tcp();
    const auto where = endpoint_.remoteAddr();

    auto resolver = std::make_shared<tcp::resolver>(executor_);
    auto socket = std::make_shared<tcp::socket>(executor_);
    auto expired = std::make_shared<bool>(false);

    // One deadline covers resolution and connect. A zero timeout leaves it unarmed.
    boost::asio::steady_timer timer(executor_);
    if (timeout.count() > 0) {
        timer.expires_after(timeout);
        timer.async_wait([resolver, socket, expired](const boost::system::error_code& ec) {
            if (ec)
                return;
            *expired = true;
            resolver->cancel();
            boost::system::error_code ignored;
            socket->close(ignored);
        });
    }

    boost::system::error_code ec;
    auto results = co_await resolver->async_resolve(target.host, std::to_string(target.port),
                                                    redirect_error(use_awaitable, ec));
    if (*expired) {
        co_return detail::timeoutFailure("Name resolution", where);
    }
    if (ec) {
        timer.cancel();
        co_return detail::connectFailure(ec, where);
    }

    co_await boost::asio::async_connect(*socket, results, redirect_error(use_awaitable, ec));
    timer.cancel();
    if (*expired) {
        co_return detail::timeoutFailure("Connect", where);
    }
    if (ec) {
        co_return detail::connectFailure(ec, where);
    }

    boost::system::error_code optEc;
    socket->set_option(tcp::no_delay(true), optEc);

    spdlog::debug("TcpConnector connected to {}", where);
    co_return std::make_unique<tcp::socket>(std::move(*socket));
}

awaitable<Result<TransportStream>> TcpConnector::connect(std::chrono::milliseconds timeout) {
    auto socket = co_await connectSocket(timeout);
    if (!socket) {
        co_return socket.error();
    }
    co_return TransportStream(std::move(socket).value());
}

//-----------------------------------------------------------------------------
// TlsConnector
//-----------------------------------------------------------------------------

#if DOCKHAND_HAS_TLS

namespace ssl = boost::asio::ssl;

struct TlsConnector::Context {
    ssl::context ssl{ssl::context::tls_client};
    std::string serverName;
    bool verify{true};
};

namespace {
Error certificateFailure(std::string_view what, const std::filesystem::path& file,
                         const boost::system::error_code& ec) {
    return makeFailure(ErrorCode::TlsError, FailureKind::Certificate,
                       fmt::format("Failed to load {} '{}'", what, file.string()), ec.message());
}

bool isIpLiteral(const std::string& host) {
    boost::system::error_code ec;
    boost::asio::ip::make_address(host, ec);
    return !ec;
}
} // namespace

TlsConnector::TlsConnector(CreateTag, boost::asio::any_io_executor executor, Endpoint endpoint,
                           std::unique_ptr<Context> context)
    : TcpConnector(std::move(executor), std::move(endpoint)), context_(std::move(context)) {}

TlsConnector::~TlsConnector() = default;

Result<std::unique_ptr<TlsConnector>> TlsConnector::create(boost::asio::any_io_executor executor,
                                                           Endpoint endpoint,
                                                           const TlsConfig& tls) {
    auto context = std::make_unique<Context>();
    boost::system::error_code ec;

    context->ssl.set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 |
                                 ssl::context::no_sslv3,
                             ec);
    if (ec) {
        return makeFailure(ErrorCode::TlsError, FailureKind::Other,
                           "Failed to configure TLS context", ec.message());
    }

    if (tls.hasClientCertificate()) {
        context->ssl.use_certificate_chain_file(tls.certFile.string(), ec);
        if (ec) {
            return certificateFailure("client certificate", tls.certFile, ec);
        }
        context->ssl.use_private_key_file(tls.keyFile.string(), ssl::context::pem, ec);
        if (ec) {
            return certificateFailure("private key", tls.keyFile, ec);
        }
    }

    if (tls.verify) {
        if (!tls.caFile.empty()) {
            context->ssl.load_verify_file(tls.caFile.string(), ec);
            if (ec) {
                return certificateFailure("CA bundle", tls.caFile, ec);
            }
        } else {
            context->ssl.set_default_verify_paths(ec);
            if (ec) {
                spdlog::warn("TlsConnector: default CA paths unavailable: {}", ec.message());
            }
        }
        context->ssl.set_verify_mode(ssl::verify_peer);
    } else {
        context->ssl.set_verify_mode(ssl::verify_none);
    }

    context->verify = tls.verify;
    context->serverName = tls.serverName.empty() ? endpoint.tcp().host : tls.serverName;

    return std::make_unique<TlsConnector>(CreateTag{}, std::move(executor), std::move(endpoint),
                                          std::move(context));
}

awaitable<Result<TransportStream>> TlsConnector::connect(std::chrono::milliseconds timeout) {
    const auto started = std::chrono::steady_clock::now();
    auto socket = co_await connectSocket(timeout);
    if (!socket) {
        co_return socket.error();
    }

    auto tls = std::make_unique<TransportStream::tls_stream>(std::move(*socket.value()),
                                                            context_->ssl);
    if (!isIpLiteral(context_->serverName) &&
        !SSL_set_tlsext_host_name(tls->native_handle(), context_->serverName.c_str())) {
        co_return makeFailure(ErrorCode::TlsError, FailureKind::Handshake,
                              fmt::format("Failed to set SNI host name '{}'",
                                          context_->serverName));
    }
    if (context_->verify) {
        tls->set_verify_callback(ssl::host_name_verification(context_->serverName));
    }

    auto* raw = tls.get();
    TransportStream stream(std::move(tls));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (timeout.count() > 0) {
        stream.expiresAfter(timeout > elapsed ? timeout - elapsed
                                              : std::chrono::milliseconds(1));
    }

    boost::system::error_code ec;
    co_await raw->async_handshake(ssl::stream_base::client, redirect_error(use_awaitable, ec));
    stream.expiresNever();

    if (stream.timedOut()) {
        co_return detail::timeoutFailure("TLS handshake", endpoint_.remoteAddr());
    }
    if (ec) {
        co_return makeFailure(ErrorCode::TlsError, FailureKind::Handshake,
                              fmt::format("TLS handshake with {} failed", endpoint_.remoteAddr()),
                              ec.message());
    }
    spdlog::debug("TlsConnector handshake complete with {}", endpoint_.remoteAddr());
    co_return stream;
}

#endif

//-----------------------------------------------------------------------------
// Factory
//-----------------------------------------------------------------------------

Result<std::unique_ptr<IConnector>> makeConnector(boost::asio::any_io_executor executor,
                                                  const Endpoint& endpoint,
                                                  const TlsConfig& tls) {
    if (endpoint.isUnix()) {
        return std::unique_ptr<IConnector>(
            std::make_unique<UnixConnector>(std::move(executor), endpoint));
    }
    if (!endpoint.isSecure()) {
        return std::unique_ptr<IConnector>(
            std::make_unique<TcpConnector>(std::move(executor), endpoint));
    }
#if DOCKHAND_HAS_TLS
    auto connector = TlsConnector::create(std::move(executor), endpoint, tls);
    if (!connector) {
        return connector.error();
    }
    return std::unique_ptr<IConnector>(std::move(connector).value());
#else
    (void)tls;
    return makeFailure(ErrorCode::TlsError, FailureKind::Other,
                       fmt::format("Cannot connect to {}: built without TLS support",
                                   endpoint.remoteAddr()));
#endif
}

} // namespace dockhand::transport
