#include <dockhand/core/failure.h>
#include <dockhand/http/connection.h>
#include <dockhand/transport/connector.h>

#include "../transport/error_mapping.h"
#include "beast_util.h"
#include "body_reader.h"
#include "stream_pool.h"

#include <boost/asio/buffer.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/http/chunk_encode.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/serializer.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>

#include <spdlog/spdlog.h>

namespace dockhand::http {

namespace beast_http = boost::beast::http;
using boost::asio::awaitable;
using boost::asio::redirect_error;
using boost::asio::use_awaitable;
using transport::TransportStream;

namespace {

struct OpenedStream {
    TransportStream stream;
    bool pooled;
};

bool expectsBody(beast_http::verb method) {
    return method == beast_http::verb::post || method == beast_http::verb::put ||
           method == beast_http::verb::patch;
}

template <class Message>
void applyHeaders(Message& msg, const Request& request, const transport::Endpoint& endpoint,
                  const ConnectionOptions& options, bool upgrade) {
    for (const auto& field : request.headers()) {
        msg.insert(field.name_string(), field.value());
    }
    if (msg.find(beast_http::field::host) == msg.end()) {
        msg.set(beast_http::field::host, endpoint.hostHeader());
    }
    if (msg.find(beast_http::field::user_agent) == msg.end() && !options.userAgent.empty()) {
        msg.set(beast_http::field::user_agent, options.userAgent);
    }
    if (upgrade) {
        if (msg.find(beast_http::field::connection) == msg.end()) {
            msg.set(beast_http::field::connection, "Upgrade");
        }
        if (msg.find(beast_http::field::upgrade) == msg.end()) {
            msg.set(beast_http::field::upgrade, "tcp");
        }
    }
}

// Daemon error bodies are {"message": "..."}; fall back to the raw text.
std::string daemonMessage(const std::string& body) {
    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("message") &&
        parsed["message"].is_string()) {
        return parsed["message"].get<std::string>();
    }
    return body.substr(0, 512);
}

} // namespace

struct Connection::Impl {
    boost::asio::any_io_executor executor;
    transport::Endpoint endpoint;
    ConnectionOptions options;
    std::unique_ptr<transport::IConnector> connector;
    std::shared_ptr<detail::StreamPool> pool;

    Impl(boost::asio::any_io_executor ex, transport::Endpoint ep, ConnectionOptions opts,
         std::unique_ptr<transport::IConnector> conn)
        : executor(std::move(ex)), endpoint(std::move(ep)), options(std::move(opts)),
          connector(std::move(conn)),
          pool(std::make_shared<detail::StreamPool>(options.maxIdleStreams)) {}

    ~Impl() { pool->clear(); }

    void arm(TransportStream& stream) const {
        if (options.headerTimeout.count() > 0) {
            stream.expiresAfter(options.headerTimeout);
        }
    }

    Error exchangeError(const TransportStream& stream, const boost::system::error_code& ec,
                        std::string_view what) const {
        if (stream.timedOut()) {
            return transport::detail::timeoutFailure(what, endpoint.remoteAddr());
        }
        return transport::detail::exchangeFailure(ec, what);
    }

    awaitable<Result<OpenedStream>> open(bool allowPooled) {
        if (allowPooled) {
            if (auto idle = pool->acquire()) {
                co_return OpenedStream{std::move(*idle), true};
            }
        }
        auto fresh = co_await connector->connect(options.connectTimeout);
        if (!fresh) {
            co_return fresh.error();
        }
        co_return OpenedStream{std::move(fresh).value(), false};
    }

    awaitable<Result<void>> writeBuffered(TransportStream& stream, const Request& request,
                                          bool upgrade) {
        beast_http::request<beast_http::string_body> msg{request.method(), request.target(), 11};
        applyHeaders(msg, request, endpoint, options, upgrade);
        if (const auto* body = request.bufferedBody()) {
            msg.body() = *body;
        } else if (expectsBody(request.method()) &&
                   msg.find(beast_http::field::content_length) == msg.end()) {
            msg.set(beast_http::field::content_length, "0");
        }

        boost::system::error_code ec;
        co_await beast_http::async_write(stream, msg, redirect_error(use_awaitable, ec));
        if (ec) {
            co_return exchangeError(stream, ec, "request write");
        }
        co_return Result<void>();
    }

    awaitable<Result<void>> writeStreaming(TransportStream& stream, Request& request,
                                           bool upgrade) {
        beast_http::request<beast_http::empty_body> msg{request.method(), request.target(), 11};
        applyHeaders(msg, request, endpoint, options, upgrade);
        beast_http::request_serializer<beast_http::empty_body> serializer{msg};

        boost::system::error_code ec;
        co_await beast_http::async_write_header(stream, serializer,
                                                redirect_error(use_awaitable, ec));
        if (ec) {
            co_return exchangeError(stream, ec, "request header write");
        }

        auto& source = *request.streamingSource();
        std::size_t total = 0;
        for (;;) {
            auto chunk = source ? source() : Result<std::optional<std::string>>(
                                                 std::optional<std::string>{});
            if (!chunk) {
                spdlog::debug("Connection: request body source failed: {}",
                              chunk.error().message);
                co_return chunk.error();
            }
            if (!chunk.value()) {
                break;
            }
            const auto& data = *chunk.value();
            if (data.empty()) {
                continue;
            }
            arm(stream);
            co_await boost::asio::async_write(
                stream, beast_http::make_chunk(boost::asio::buffer(data.data(), data.size())),
                redirect_error(use_awaitable, ec));
            if (ec) {
                co_return exchangeError(stream, ec, "request body write");
            }
            total += data.size();
        }
        co_await boost::asio::async_write(stream, beast_http::make_chunk_last(),
                                          redirect_error(use_awaitable, ec));
        if (ec) {
            co_return exchangeError(stream, ec, "request body write");
        }
        spdlog::trace("Connection: streamed {} request body bytes", total);
        co_return Result<void>();
    }

    // Writes the request and parses the response header on the given stream.
    awaitable<Result<std::unique_ptr<detail::BodyReader>>>
    exchange(TransportStream stream, Request& request, bool upgrade) {
        arm(stream);
        auto written = request.isStreaming() ? co_await writeStreaming(stream, request, upgrade)
                                             : co_await writeBuffered(stream, request, upgrade);
        if (!written) {
            stream.close();
            co_return written.error();
        }

        auto reader = std::make_unique<detail::BodyReader>(stream, pool, options.bodyTimeout);
        if (request.method() == beast_http::verb::head) {
            reader->parser().skip(true);
        }

        arm(stream);
        boost::system::error_code ec;
        co_await beast_http::async_read_header(stream, reader->buffer(), reader->parser(),
                                               redirect_error(use_awaitable, ec));
        stream.expiresNever();
        if (ec || stream.timedOut()) {
            co_return exchangeError(stream, ec, "response header read");
        }
        co_return std::move(reader);
    }
};

Result<Connection> Connection::create(boost::asio::any_io_executor executor,
                                      transport::Endpoint endpoint, ConnectionOptions options) {
    auto connector = transport::makeConnector(executor, endpoint, options.tls);
    if (!connector) {
        return connector.error();
    }
    spdlog::debug("Connection: created for {}", endpoint.toString());
    return Connection(std::make_shared<Impl>(std::move(executor), std::move(endpoint),
                                             std::move(options), std::move(connector).value()));
}

awaitable<Result<Response>> Connection::send(Request request) {
    auto impl = impl_;
    const bool replayable = !request.isStreaming();

    for (int attempt = 0;; ++attempt) {
        auto opened = co_await impl->open(attempt == 0);
        if (!opened) {
            co_return opened.error();
        }
        const bool pooled = opened.value().pooled;
        spdlog::trace("Connection: {} {} ({}, {})",
                      detail::toStd(beast_http::to_string(request.method())), request.target(),
                      impl->endpoint.remoteAddr(), pooled ? "reused" : "new");

        auto exchanged = co_await impl->exchange(std::move(opened).value().stream, request, false);
        if (!exchanged) {
            // A parked stream the daemon has since closed; replay once on a fresh one.
            if (pooled && replayable && attempt == 0 &&
                failureKindOf(exchanged.error()) == FailureKind::Reset) {
                spdlog::debug("Connection: idle stream was closed by the daemon, reconnecting");
                continue;
            }
            co_return exchanged.error();
        }

        auto reader = std::move(exchanged).value();
        const auto& msg = reader->parser().get();
        const unsigned status = msg.result_int();
        beast_http::fields headers;
        for (const auto& field : msg) {
            headers.insert(field.name_string(), field.value());
        }

        if (reader->parser().is_done()) {
            reader->finish();
            co_return Response(status, std::move(headers), std::string{},
                               impl->options.maxBodySize);
        }
        co_return Response(status, std::move(headers), std::move(reader),
                           impl->options.maxBodySize);
    }
}

awaitable<Result<UpgradedStream>> Connection::upgrade(Request request) {
    auto impl = impl_;
    auto opened = co_await impl->open(false);
    if (!opened) {
        co_return opened.error();
    }

    auto exchanged = co_await impl->exchange(std::move(opened).value().stream, request, true);
    if (!exchanged) {
        co_return exchanged.error();
    }
    auto reader = std::move(exchanged).value();
    const unsigned status = reader->parser().get().result_int();
    if (status != 101) {
        co_return makeFailure(ErrorCode::Io, FailureKind::NotUpgraded,
                              fmt::format("Daemon answered {} to {} instead of 101 Switching "
                                          "Protocols",
                                          status, request.target()));
    }

    auto leftover = boost::beast::buffers_to_string(reader->buffer().data());
    spdlog::debug("Connection: upgraded {} ({} bytes already buffered)", request.target(),
                  leftover.size());
    co_return UpgradedStream(reader->detach(), std::move(leftover));
}

awaitable<Result<Response>> Connection::get(std::string endpoint) {
    co_return co_await send(RequestBuilder(beast_http::verb::get, endpoint).preEncoded().build());
}

awaitable<Result<Response>> Connection::head(std::string endpoint) {
    co_return co_await send(
        RequestBuilder(beast_http::verb::head, endpoint).preEncoded().build());
}

awaitable<Result<Response>> Connection::del(std::string endpoint) {
    co_return co_await send(
        RequestBuilder(beast_http::verb::delete_, endpoint).preEncoded().build());
}

awaitable<Result<Response>> Connection::post(std::string endpoint, Payload payload) {
    co_return co_await send(RequestBuilder(beast_http::verb::post, endpoint)
                                .preEncoded()
                                .body(std::move(payload))
                                .build());
}

awaitable<Result<Response>> Connection::put(std::string endpoint, Payload payload) {
    co_return co_await send(RequestBuilder(beast_http::verb::put, endpoint)
                                .preEncoded()
                                .body(std::move(payload))
                                .build());
}

namespace {
awaitable<Result<nlohmann::json>> jsonOrDaemonError(Result<Response> response,
                                                    std::string what) {
    if (!response) {
        co_return response.error();
    }
    auto& res = response.value();
    if (!res.isSuccess()) {
        auto body = co_await res.readAll();
        co_return Error{ErrorCode::Io,
                        fmt::format("{} failed with status {}: {}", what, res.status(),
                                    body ? daemonMessage(body.value()) : body.error().message)};
    }
    co_return co_await res.readJson();
}
} // namespace

awaitable<Result<nlohmann::json>> Connection::getJson(std::string endpoint) {
    auto response = co_await get(endpoint);
    co_return co_await jsonOrDaemonError(std::move(response), "GET " + endpoint);
}

awaitable<Result<nlohmann::json>> Connection::postJson(std::string endpoint,
                                                       nlohmann::json body) {
    auto response = co_await post(endpoint, Payload::json(body.dump()));
    co_return co_await jsonOrDaemonError(std::move(response), "POST " + endpoint);
}

const transport::Endpoint& Connection::endpoint() const noexcept {
    return impl_->endpoint;
}

const ConnectionOptions& Connection::options() const noexcept {
    return impl_->options;
}

std::size_t Connection::idleStreams() const {
    return impl_->pool->idle();
}

void Connection::closeIdle() {
    impl_->pool->clear();
}

} // namespace dockhand::http
