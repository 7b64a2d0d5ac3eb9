#include <dockhand/core/failure.h>
#include <dockhand/http/response.h>

#include "beast_util.h"
#include "body_reader.h"

#include <charconv>

#include <spdlog/spdlog.h>

namespace dockhand::http {

namespace beast_http = boost::beast::http;
using boost::asio::awaitable;

namespace {
Error alreadyConsumed(std::string_view what) {
    return makeFailure(ErrorCode::Io, FailureKind::Consumed,
                       fmt::format("{} already consumed", what));
}
} // namespace

//-----------------------------------------------------------------------------
// BodyStream
//-----------------------------------------------------------------------------

BodyStream::BodyStream(std::unique_ptr<detail::BodyReader> reader) : reader_(std::move(reader)) {}

BodyStream::BodyStream(std::string materialized) : pending_(std::move(materialized)) {
    if (pending_->empty()) {
        pending_.reset();
    }
}

BodyStream::BodyStream(BodyStream&&) noexcept = default;
BodyStream& BodyStream::operator=(BodyStream&&) noexcept = default;
BodyStream::~BodyStream() = default;

awaitable<Result<std::optional<std::string>>> BodyStream::next() {
    if (pending_) {
        auto chunk = std::move(*pending_);
        pending_.reset();
        co_return std::optional<std::string>(std::move(chunk));
    }
    if (ended_) {
        co_return alreadyConsumed("Response stream");
    }
    if (!reader_) {
        ended_ = true;
        co_return std::optional<std::string>{};
    }

    auto chunk = co_await reader_->next();
    if (chunk && !chunk.value()) {
        ended_ = true;
        reader_.reset();
    }
    co_return std::move(chunk);
}

LineStream BodyStream::lines() && {
    return LineStream(std::move(*this));
}

//-----------------------------------------------------------------------------
// LineStream
//-----------------------------------------------------------------------------

LineStream::LineStream(BodyStream body) : body_(std::move(body)) {}

awaitable<Result<std::optional<std::string>>> LineStream::next() {
    for (;;) {
        auto nl = buffer_.find('\n');
        if (nl != std::string::npos) {
            std::string line = buffer_.substr(0, nl);
            buffer_.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            co_return std::optional<std::string>(std::move(line));
        }
        if (sourceDone_) {
            if (buffer_.empty()) {
                co_return co_await body_.next();
            }
            std::string last = std::move(buffer_);
            buffer_.clear();
            if (!last.empty() && last.back() == '\r') {
                last.pop_back();
            }
            co_return std::optional<std::string>(std::move(last));
        }

        auto chunk = co_await body_.next();
        if (!chunk) {
            co_return chunk.error();
        }
        if (!chunk.value()) {
            sourceDone_ = true;
            if (buffer_.empty()) {
                co_return std::optional<std::string>{};
            }
            continue;
        }
        buffer_ += *chunk.value();
    }
}

awaitable<Result<std::optional<nlohmann::json>>> LineStream::nextJson() {
    for (;;) {
        auto line = co_await next();
        if (!line) {
            co_return line.error();
        }
        if (!line.value()) {
            co_return std::optional<nlohmann::json>{};
        }
        const auto& text = *line.value();
        if (text.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        auto parsed = nlohmann::json::parse(text, nullptr, false);
        if (parsed.is_discarded()) {
            co_return Error{ErrorCode::Serialization,
                            fmt::format("Invalid JSON record in stream: {}",
                                        text.substr(0, 128))};
        }
        co_return std::optional<nlohmann::json>(std::move(parsed));
    }
}

//-----------------------------------------------------------------------------
// Response
//-----------------------------------------------------------------------------

Response::Response(unsigned status, beast_http::fields headers,
                   std::unique_ptr<detail::BodyReader> reader, std::size_t maxBodySize)
    : status_(status), headers_(std::move(headers)), reader_(std::move(reader)),
      maxBodySize_(maxBodySize) {}

Response::Response(unsigned status, beast_http::fields headers, std::string body,
                   std::size_t maxBodySize)
    : status_(status), headers_(std::move(headers)), materialized_(std::move(body)),
      maxBodySize_(maxBodySize) {}

Response::Response(Response&&) noexcept = default;
Response& Response::operator=(Response&&) noexcept = default;
Response::~Response() = default;

std::optional<std::string> Response::header(std::string_view name) const {
    auto it = headers_.find(detail::toBeast(name));
    if (it == headers_.end()) {
        return std::nullopt;
    }
    return detail::toString(it->value());
}

std::string Response::contentType() const {
    return header("Content-Type").value_or(std::string{});
}

std::optional<std::size_t> Response::contentLength() const {
    auto raw = header("Content-Length");
    if (!raw) {
        return std::nullopt;
    }
    std::size_t value = 0;
    auto [ptr, ec] = std::from_chars(raw->data(), raw->data() + raw->size(), value);
    if (ec != std::errc{} || ptr != raw->data() + raw->size()) {
        return std::nullopt;
    }
    return value;
}

Error Response::consumedError() const {
    return alreadyConsumed("Response body");
}

awaitable<Result<std::string>> Response::readAll() {
    if (consumed_) {
        co_return consumedError();
    }
    consumed_ = true;

    if (!reader_) {
        if (materialized_.size() > maxBodySize_) {
            co_return Error{ErrorCode::BodyTooLarge,
                            fmt::format("Response body of {} bytes exceeds limit of {} bytes",
                                        materialized_.size(), maxBodySize_)};
        }
        co_return std::move(materialized_);
    }

    auto reader = std::move(reader_);
    if (auto declared = reader->contentLength(); declared && *declared > maxBodySize_) {
        reader->abandon();
        co_return Error{ErrorCode::BodyTooLarge,
                        fmt::format("Response declares {} bytes, limit is {} bytes", *declared,
                                    maxBodySize_)};
    }

    std::string body;
    if (auto declared = reader->contentLength()) {
        body.reserve(static_cast<std::size_t>(*declared));
    }
    for (;;) {
        auto chunk = co_await reader->next();
        if (!chunk) {
            co_return chunk.error();
        }
        if (!chunk.value()) {
            break;
        }
        if (body.size() + chunk.value()->size() > maxBodySize_) {
            reader->abandon();
            co_return Error{ErrorCode::BodyTooLarge,
                            fmt::format("Response body exceeds limit of {} bytes", maxBodySize_)};
        }
        body += *chunk.value();
    }
    co_return std::move(body);
}

awaitable<Result<nlohmann::json>> Response::readJson() {
    auto body = co_await readAll();
    if (!body) {
        co_return body.error();
    }
    auto parsed = nlohmann::json::parse(body.value(), nullptr, false);
    if (parsed.is_discarded()) {
        co_return Error{ErrorCode::Serialization,
                        fmt::format("Response body is not valid JSON ({} bytes, content type "
                                    "'{}')",
                                    body.value().size(), contentType())};
    }
    co_return std::move(parsed);
}

Result<BodyStream> Response::stream() {
    if (consumed_) {
        return consumedError();
    }
    consumed_ = true;
    if (reader_) {
        return BodyStream(std::move(reader_));
    }
    return BodyStream(std::move(materialized_));
}

} // namespace dockhand::http
