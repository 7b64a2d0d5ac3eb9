#pragma once

#include <string_view>

#include <boost/asio/error.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/system/error_code.hpp>

#include <dockhand/core/failure.h>
#include <spdlog/fmt/fmt.h>

namespace dockhand::transport::detail {

inline bool isDnsFailure(const boost::system::error_code& ec) {
    return ec == boost::asio::error::host_not_found ||
           ec == boost::asio::error::host_not_found_try_again ||
           ec == boost::asio::error::no_data || ec == boost::asio::error::no_recovery ||
           ec == boost::asio::error::service_not_found;
}

inline bool isResetFailure(const boost::system::error_code& ec) {
    return ec == boost::asio::error::eof || ec == boost::asio::error::connection_reset ||
           ec == boost::asio::error::broken_pipe || ec == boost::asio::error::connection_aborted ||
           ec == boost::asio::error::not_connected || ec == boost::beast::http::error::end_of_stream ||
           ec == boost::beast::http::error::partial_message;
}

inline bool isFramingFailure(const boost::system::error_code& ec) {
    return ec.category() == boost::beast::http::make_error_code(boost::beast::http::error::bad_chunk).category() &&
           !isResetFailure(ec) && ec != boost::beast::http::error::need_buffer;
}

// Transport kind never changes the code, only the diagnostic.
inline Error connectFailure(const boost::system::error_code& ec, std::string_view target) {
    if (ec == boost::asio::error::connection_refused) {
        return makeFailure(ErrorCode::ConnectionFailed, FailureKind::Refused,
                           fmt::format("Connection refused ({}). Is the daemon running?", target),
                           ec.message());
    }
    if (isDnsFailure(ec)) {
        return makeFailure(ErrorCode::ConnectionFailed, FailureKind::Dns,
                           fmt::format("Could not resolve host ({})", target), ec.message());
    }
    if (ec == boost::system::errc::no_such_file_or_directory) {
        return makeFailure(ErrorCode::ConnectionFailed, FailureKind::SocketMissing,
                           fmt::format("Socket not found ({})", target), ec.message());
    }
    return makeFailure(ErrorCode::ConnectionFailed, FailureKind::Other,
                       fmt::format("Connection failed ({}): {}", target, ec.message()),
                       ec.message());
}

inline Error timeoutFailure(std::string_view what, std::string_view target) {
    return makeFailure(ErrorCode::Timeout, FailureKind::Timeout,
                       fmt::format("{} timed out ({})", what, target));
}

// Classifies an error raised while writing a request or reading a response.
inline Error exchangeFailure(const boost::system::error_code& ec, std::string_view what) {
    if (isResetFailure(ec)) {
        return makeFailure(ErrorCode::Io, FailureKind::Reset,
                           fmt::format("Connection closed by daemon during {}", what),
                           ec.message());
    }
    if (isFramingFailure(ec)) {
        return makeFailure(ErrorCode::Serialization, FailureKind::MalformedChunk,
                           fmt::format("Malformed HTTP framing during {}", what), ec.message());
    }
    return makeFailure(ErrorCode::Io, FailureKind::Other,
                       fmt::format("I/O failure during {}: {}", what, ec.message()), ec.message());
}

} // namespace dockhand::transport::detail
