#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <dockhand/core/types.h>

namespace dockhand {

// Stable classification for transport, stream and archive failures.
//
// The public contract is ErrorCode; the kind only refines the diagnostic. It is carried as
// a prefix in Error.message ("[transport:refused] ...") so callers never see a transport
// specific error type.
enum class FailureKind {
    SocketMissing,
    PathNotSocket,
    Refused,
    Dns,
    Handshake,
    Certificate,
    Timeout,
    Reset,
    MalformedChunk,
    MalformedFrame,
    Consumed,
    NotUpgraded,
    PathEscapesRoot,
    ArchiveIo,
    Other
};

inline constexpr std::string_view kFailurePrefix = "[";

inline constexpr std::string_view to_string(FailureKind k) {
    switch (k) {
        case FailureKind::SocketMissing:
            return "transport:socket_missing";
        case FailureKind::PathNotSocket:
            return "transport:path_not_socket";
        case FailureKind::Refused:
            return "transport:refused";
        case FailureKind::Dns:
            return "transport:dns";
        case FailureKind::Handshake:
            return "tls:handshake";
        case FailureKind::Certificate:
            return "tls:certificate";
        case FailureKind::Timeout:
            return "transport:timeout";
        case FailureKind::Reset:
            return "stream:reset";
        case FailureKind::MalformedChunk:
            return "stream:malformed_chunk";
        case FailureKind::MalformedFrame:
            return "stream:malformed_frame";
        case FailureKind::Consumed:
            return "stream:consumed";
        case FailureKind::NotUpgraded:
            return "stream:not_upgraded";
        case FailureKind::PathEscapesRoot:
            return "archive:path_escapes_root";
        case FailureKind::ArchiveIo:
            return "archive:io";
        case FailureKind::Other:
            return "other";
    }
    return "other";
}

inline std::string formatFailure(FailureKind kind, std::string_view detail) {
    std::string out;
    out.reserve(kFailurePrefix.size() + 32 + 2 + detail.size());
    out.append(kFailurePrefix);
    out.append(to_string(kind));
    out.push_back(']');
    out.push_back(' ');
    out.append(detail);
    return out;
}

inline Error makeFailure(ErrorCode code, FailureKind kind, std::string_view detail,
                         std::string cause = {}) {
    return Error{code, formatFailure(kind, detail), std::move(cause)};
}

inline std::optional<FailureKind> parseFailureKind(std::string_view message) {
    if (!message.starts_with(kFailurePrefix)) {
        return std::nullopt;
    }
    auto close = message.find(']');
    if (close == std::string_view::npos || close <= kFailurePrefix.size()) {
        return std::nullopt;
    }
    // message looks like: [<area>:<kind>] ...
    auto kind = message.substr(kFailurePrefix.size(), close - kFailurePrefix.size());
    for (auto k : {FailureKind::SocketMissing, FailureKind::PathNotSocket, FailureKind::Refused,
                   FailureKind::Dns, FailureKind::Handshake, FailureKind::Certificate,
                   FailureKind::Timeout, FailureKind::Reset, FailureKind::MalformedChunk,
                   FailureKind::MalformedFrame, FailureKind::Consumed, FailureKind::NotUpgraded,
                   FailureKind::PathEscapesRoot, FailureKind::ArchiveIo, FailureKind::Other}) {
        if (kind == to_string(k))
            return k;
    }
    return std::nullopt;
}

inline std::optional<FailureKind> failureKindOf(const Error& error) {
    return parseFailureKind(error.message);
}

} // namespace dockhand
