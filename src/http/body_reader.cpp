#include "body_reader.h"
#include "stream_pool.h"
#include "../transport/error_mapping.h"

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/http/read.hpp>

#include <spdlog/spdlog.h>

namespace dockhand::http::detail {

namespace beast_http = boost::beast::http;
using boost::asio::redirect_error;
using boost::asio::use_awaitable;

BodyReader::BodyReader(transport::TransportStream stream, std::weak_ptr<StreamPool> pool,
                       std::chrono::milliseconds readTimeout)
    : stream_(std::move(stream)), scratch_(DEFAULT_BUFFER_SIZE), pool_(std::move(pool)),
      readTimeout_(readTimeout) {
    // Limits are enforced by Response::readAll; streamed bodies are unbounded.
    parser_.body_limit(boost::none);
    parser_.header_limit(64 * 1024);
}

BodyReader::~BodyReader() {
    if (!released_) {
        abandon();
    }
}

std::optional<std::uint64_t> BodyReader::contentLength() const {
    auto len = parser_.content_length();
    if (!len) {
        return std::nullopt;
    }
    return *len;
}

void BodyReader::finish() {
    done_ = true;
    if (released_) {
        return;
    }
    auto pool = pool_.lock();
    if (pool && parser_.keep_alive() && buffer_.size() == 0 && stream_.isOpen()) {
        released_ = true;
        pool->release(stream_);
        return;
    }
    abandon();
}

void BodyReader::abandon() noexcept {
    released_ = true;
    stream_.close();
}

transport::TransportStream BodyReader::detach() noexcept {
    released_ = true;
    done_ = true;
    return stream_;
}

boost::asio::awaitable<Result<std::optional<std::string>>> BodyReader::next() {
    if (failed_) {
        co_return *failed_;
    }
    if (done_) {
        co_return std::optional<std::string>{};
    }

    for (;;) {
        auto& body = parser_.get().body();
        body.data = scratch_.data();
        body.size = scratch_.size();

        if (readTimeout_.count() > 0) {
            stream_.expiresAfter(readTimeout_);
        }
        boost::system::error_code ec;
        co_await beast_http::async_read_some(stream_, buffer_, parser_,
                                             redirect_error(use_awaitable, ec));
        if (readTimeout_.count() > 0) {
            stream_.expiresNever();
        }
        if (ec == beast_http::error::need_buffer) {
            ec = {};
        }

        if (stream_.timedOut()) {
            failed_ = transport::detail::timeoutFailure("Response body read", "idle deadline");
        } else if (ec) {
            failed_ = transport::detail::exchangeFailure(ec, "response body");
        }
        if (failed_) {
            spdlog::debug("BodyReader: stream terminated: {}", failed_->message);
            abandon();
            co_return *failed_;
        }

        const auto n = scratch_.size() - body.size;
        if (parser_.is_done()) {
            finish();
            if (n == 0) {
                co_return std::optional<std::string>{};
            }
        } else if (n == 0) {
            continue;
        }
        spdlog::trace("BodyReader: chunk of {} bytes", n);
        co_return std::string(scratch_.data(), n);
    }
}

} // namespace dockhand::http::detail
