#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <boost/asio/any_io_executor.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include <dockhand/core/types.h>
#include <dockhand/http/request.h>
#include <dockhand/http/response.h>
#include <dockhand/http/upgraded_stream.h>
#include <dockhand/transport/endpoint.h>
#include <dockhand/transport/transport_options.h>

namespace dockhand::http {

using transport::ConnectionOptions;

// Sends requests to one daemon endpoint.
//
// A Connection is a factory for transport streams plus a small pool of idle keep-alive
// streams, not a single socket. Copies share the same connector and pool. All settings
// (TLS material, deadlines, limits) belong to the instance.
class Connection {
public:
    static Result<Connection> create(boost::asio::any_io_executor executor,
                                     transport::Endpoint endpoint,
                                     ConnectionOptions options = {});

    // Writes the request and returns once the response header is parsed; the body stays
    // on the wire until the Response is read or streamed.
    boost::asio::awaitable<Result<Response>> send(Request request);

    // Sends the request with Connection: Upgrade and expects 101 Switching Protocols.
    boost::asio::awaitable<Result<UpgradedStream>> upgrade(Request request);

    // Shorthands taking an already encoded endpoint, query included
    // (see url::constructEndpoint).
    boost::asio::awaitable<Result<Response>> get(std::string endpoint);
    boost::asio::awaitable<Result<Response>> head(std::string endpoint);
    boost::asio::awaitable<Result<Response>> del(std::string endpoint);
    boost::asio::awaitable<Result<Response>> post(std::string endpoint, Payload payload);
    boost::asio::awaitable<Result<Response>> put(std::string endpoint, Payload payload);

    // GET/POST returning the parsed JSON body; a non-2xx status fails with ErrorCode::Io
    // and carries the daemon's "message" field when present.
    boost::asio::awaitable<Result<nlohmann::json>> getJson(std::string endpoint);
    boost::asio::awaitable<Result<nlohmann::json>> postJson(std::string endpoint,
                                                            nlohmann::json body);

    const transport::Endpoint& endpoint() const noexcept;
    const ConnectionOptions& options() const noexcept;
    // Keep-alive streams currently parked for reuse.
    std::size_t idleStreams() const;
    // Closes every parked stream. Streams owned by live responses are unaffected.
    void closeIdle();

private:
    struct Impl;
    explicit Connection(std::shared_ptr<Impl> impl) : impl_(std::move(impl)) {}

    std::shared_ptr<Impl> impl_;
};

} // namespace dockhand::http
