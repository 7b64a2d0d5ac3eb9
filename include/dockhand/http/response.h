#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/status.hpp>
#include <nlohmann/json.hpp>

#include <dockhand/core/types.h>

namespace dockhand::http {

namespace detail {
class BodyReader;
}

class LineStream;

// Forward-only body of one response, pulled chunk by chunk.
//
// next() yields chunks in the order the daemon sent them and std::nullopt at a clean end.
// An error ends the stream and is returned again on every later call. Pulling after the
// clean end fails with [stream:consumed]. Destroying the stream before the end closes the
// socket; a fully read keep-alive response hands its socket back to the Connection.
class BodyStream {
public:
    BodyStream(BodyStream&&) noexcept;
    BodyStream& operator=(BodyStream&&) noexcept;
    ~BodyStream();

    boost::asio::awaitable<Result<std::optional<std::string>>> next();

    // Newline-delimited records over the same body (consumes this stream).
    LineStream lines() &&;

    bool finished() const noexcept { return ended_; }

private:
    friend class Response;
    explicit BodyStream(std::unique_ptr<detail::BodyReader> reader);
    explicit BodyStream(std::string materialized);

    std::unique_ptr<detail::BodyReader> reader_;
    std::optional<std::string> pending_;
    bool ended_{false};
};

// Splits a body into records on '\n'. A trailing "\r" is stripped; the last record is
// delivered even without a terminating newline.
class LineStream {
public:
    explicit LineStream(BodyStream body);

    boost::asio::awaitable<Result<std::optional<std::string>>> next();
    // Skips blank lines; a record that is not valid JSON fails with ErrorCode::Serialization.
    boost::asio::awaitable<Result<std::optional<nlohmann::json>>> nextJson();

private:
    BodyStream body_;
    std::string buffer_;
    bool sourceDone_{false};
};

// Status and headers of one response. The body has not been read when send() returns.
class Response {
public:
    Response(Response&&) noexcept;
    Response& operator=(Response&&) noexcept;
    ~Response();

    unsigned status() const noexcept { return status_; }
    boost::beast::http::status statusCode() const noexcept {
        return static_cast<boost::beast::http::status>(status_);
    }
    bool isSuccess() const noexcept { return status_ >= 200 && status_ < 300; }

    const boost::beast::http::fields& headers() const noexcept { return headers_; }
    std::optional<std::string> header(std::string_view name) const;
    std::string contentType() const;
    std::optional<std::size_t> contentLength() const;

    // True while the body is still on the wire.
    bool isStreaming() const noexcept { return reader_ != nullptr; }
    bool consumed() const noexcept { return consumed_; }

    // Buffers the whole body. Fails with ErrorCode::BodyTooLarge once more than the
    // Connection's maxBodySize would be held; the socket is then closed.
    boost::asio::awaitable<Result<std::string>> readAll();
    boost::asio::awaitable<Result<nlohmann::json>> readJson();

    // Hands the body out as a stream; no size limit applies.
    Result<BodyStream> stream();

private:
    friend class Connection;
    Response(unsigned status, boost::beast::http::fields headers,
             std::unique_ptr<detail::BodyReader> reader, std::size_t maxBodySize);
    Response(unsigned status, boost::beast::http::fields headers, std::string body,
             std::size_t maxBodySize);

    Error consumedError() const;

    unsigned status_;
    boost::beast::http::fields headers_;
    std::unique_ptr<detail::BodyReader> reader_;
    std::string materialized_;
    std::size_t maxBodySize_;
    bool consumed_{false};
};

} // namespace dockhand::http
