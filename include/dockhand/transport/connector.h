#pragma once

#include <chrono>
#include <memory>

#include <boost/asio/any_io_executor.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>

#include <dockhand/core/types.h>
#include <dockhand/transport/endpoint.h>
#include <dockhand/transport/transport_options.h>
#include <dockhand/transport/transport_stream.h>

namespace dockhand::transport {

// Opens new transport-level streams to one endpoint on demand.
class IConnector {
public:
    virtual ~IConnector() = default;

    virtual boost::asio::awaitable<Result<TransportStream>>
    connect(std::chrono::milliseconds timeout) = 0;

    virtual const Endpoint& endpoint() const noexcept = 0;
};

class UnixConnector final : public IConnector {
public:
    UnixConnector(boost::asio::any_io_executor executor, Endpoint endpoint);

    boost::asio::awaitable<Result<TransportStream>>
    connect(std::chrono::milliseconds timeout) override;

    const Endpoint& endpoint() const noexcept override { return endpoint_; }

private:
    boost::asio::any_io_executor executor_;
    Endpoint endpoint_;
};

class TcpConnector : public IConnector {
public:
    TcpConnector(boost::asio::any_io_executor executor, Endpoint endpoint);

    boost::asio::awaitable<Result<TransportStream>>
    connect(std::chrono::milliseconds timeout) override;

    const Endpoint& endpoint() const noexcept override { return endpoint_; }

protected:
    // Resolves and connects a plain TCP socket; shared with the TLS connector.
    boost::asio::awaitable<Result<std::unique_ptr<boost::asio::ip::tcp::socket>>>
    connectSocket(std::chrono::milliseconds timeout);

    boost::asio::any_io_executor executor_;
    Endpoint endpoint_;
};

#if DOCKHAND_HAS_TLS
class TlsConnector final : public TcpConnector {
public:
    // Builds the per-connector ssl::context; fails with TlsError when the certificate
    // material cannot be loaded.
    static Result<std::unique_ptr<TlsConnector>>
    create(boost::asio::any_io_executor executor, Endpoint endpoint, const TlsConfig& tls);

    struct Context;
    struct CreateTag {};
    TlsConnector(CreateTag, boost::asio::any_io_executor executor, Endpoint endpoint,
                 std::unique_ptr<Context> context);
    ~TlsConnector() override;

    boost::asio::awaitable<Result<TransportStream>>
    connect(std::chrono::milliseconds timeout) override;

private:
    std::unique_ptr<Context> context_;
};
#endif

// Picks the connector variant for the endpoint. TLS material is only used for https.
Result<std::unique_ptr<IConnector>> makeConnector(boost::asio::any_io_executor executor,
                                                  const Endpoint& endpoint,
                                                  const TlsConfig& tls = {});

} // namespace dockhand::transport
