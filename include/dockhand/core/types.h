#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace dockhand {

// Type aliases
using ByteVector = std::vector<std::byte>;
using ByteSpan = std::span<const std::byte>;
using Duration = std::chrono::milliseconds;

// Error types
enum class ErrorCode {
    Success = 0,
    Io,
    InvalidEndpoint,
    ConnectionFailed,
    TlsError,
    Timeout,
    Serialization,
    ArchiveError,
    BodyTooLarge
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Io: return "I/O error";
        case ErrorCode::InvalidEndpoint: return "Invalid endpoint";
        case ErrorCode::ConnectionFailed: return "Connection failed";
        case ErrorCode::TlsError: return "TLS error";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::Serialization: return "Serialization error";
        case ErrorCode::ArchiveError: return "Archive error";
        case ErrorCode::BodyTooLarge: return "Body too large";
    }
    return "Unknown error";
}

// Error struct for detailed error information.
// `cause` keeps the text of the wrapped library/system error for diagnostics only.
struct Error {
    ErrorCode code;
    std::string message;
    std::string cause;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg, std::string why)
        : code(c), message(std::move(msg)), cause(std::move(why)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }

    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }

    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Simple Result type for operations that can fail
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

} // namespace dockhand

// fmt library support for ErrorCode (for spdlog)
#include <spdlog/fmt/fmt.h>
template <> struct fmt::formatter<dockhand::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(dockhand::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", dockhand::errorToString(error));
    }
};

namespace dockhand {

// Common constants
inline constexpr std::size_t DEFAULT_BUFFER_SIZE = 64 * 1024;                // 64KB
inline constexpr std::size_t DEFAULT_MAX_BODY_SIZE = 64ull * 1024 * 1024;    // 64MB
inline constexpr std::size_t DEFAULT_ARCHIVE_CHUNK_SIZE = 128 * 1024;        // 128KB
inline constexpr std::size_t MIN_ARCHIVE_CHUNK_SIZE = 4 * 1024;              // 4KB

} // namespace dockhand
