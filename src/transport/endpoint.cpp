#include <dockhand/transport/endpoint.h>

#include <spdlog/fmt/fmt.h>
#include <charconv>

namespace dockhand::transport {

namespace {

constexpr std::string_view kUnixPrefix = "unix://";
constexpr std::string_view kHttpPrefix = "http://";
constexpr std::string_view kHttpsPrefix = "https://";

Error invalid(std::string_view text, std::string_view why) {
    return Error{ErrorCode::InvalidEndpoint, fmt::format("Invalid endpoint '{}': {}", text, why)};
}

Result<std::uint16_t> parsePort(std::string_view text, std::string_view digits) {
    if (digits.empty()) {
        return invalid(text, "empty port");
    }
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return invalid(text, "port is not a number");
    }
    if (value == 0 || value > 65535) {
        return invalid(text, "port out of range");
    }
    return static_cast<std::uint16_t>(value);
}

Result<Endpoint> parseTcp(std::string_view text, std::string_view rest, Scheme scheme) {
    // Only the root path is meaningful for the daemon API.
    if (auto slash = rest.find('/'); slash != std::string_view::npos) {
        if (rest.substr(slash) != "/") {
            return invalid(text, "path component is not supported");
        }
        rest = rest.substr(0, slash);
    }
    if (rest.find_first_of("?#@") != std::string_view::npos) {
        return invalid(text, "query, fragment and userinfo are not supported");
    }

    std::string_view host;
    std::string_view portText;
    bool hasPort = false;
    if (!rest.empty() && rest.front() == '[') {
        auto close = rest.find(']');
        if (close == std::string_view::npos) {
            return invalid(text, "unterminated IPv6 literal");
        }
        host = rest.substr(1, close - 1);
        auto tail = rest.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') {
                return invalid(text, "unexpected characters after IPv6 literal");
            }
            portText = tail.substr(1);
            hasPort = true;
        }
    } else {
        auto colon = rest.rfind(':');
        if (colon != std::string_view::npos) {
            host = rest.substr(0, colon);
            portText = rest.substr(colon + 1);
            hasPort = true;
        } else {
            host = rest;
        }
    }

    if (host.empty()) {
        return invalid(text, "empty host");
    }

    std::uint16_t port = defaultPort(scheme);
    if (hasPort) {
        auto parsed = parsePort(text, portText);
        if (!parsed) {
            return parsed.error();
        }
        port = parsed.value();
    }
    return Endpoint::forTcp(std::string(host), port, scheme);
}

} // namespace

Result<Endpoint> Endpoint::parse(std::string_view text) {
    if (text.starts_with(kUnixPrefix)) {
        auto path = text.substr(kUnixPrefix.size());
        if (path.empty()) {
            return invalid(text, "empty socket path");
        }
        return Endpoint::forUnix(std::filesystem::path(std::string(path)));
    }
    if (text.starts_with(kHttpPrefix)) {
        return parseTcp(text, text.substr(kHttpPrefix.size()), Scheme::Http);
    }
    if (text.starts_with(kHttpsPrefix)) {
        return parseTcp(text, text.substr(kHttpsPrefix.size()), Scheme::Https);
    }
    return invalid(text, "unrecognized scheme");
}

Endpoint Endpoint::forUnix(std::filesystem::path path) {
    return Endpoint(UnixSocket{std::move(path)});
}

Endpoint Endpoint::forTcp(std::string host, std::uint16_t port, Scheme scheme) {
    return Endpoint(Tcp{std::move(host), port, scheme});
}

bool Endpoint::isSecure() const noexcept {
    const auto* t = std::get_if<Tcp>(&address_);
    return t != nullptr && t->scheme == Scheme::Https;
}

namespace {
std::string bracketed(const std::string& host) {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]";
    }
    return host;
}
} // namespace

std::string Endpoint::toString() const {
    if (const auto* u = std::get_if<UnixSocket>(&address_)) {
        return std::string(kUnixPrefix) + u->path.string();
    }
    const auto& t = std::get<Tcp>(address_);
    return fmt::format("{}://{}:{}", schemeName(t.scheme), bracketed(t.host), t.port);
}

std::string Endpoint::remoteAddr() const {
    if (const auto* u = std::get_if<UnixSocket>(&address_)) {
        return u->path.string();
    }
    return toString();
}

std::string Endpoint::hostHeader() const {
    if (isUnix()) {
        return "localhost";
    }
    const auto& t = std::get<Tcp>(address_);
    if (t.port == defaultPort(t.scheme)) {
        return bracketed(t.host);
    }
    return fmt::format("{}:{}", bracketed(t.host), t.port);
}

} // namespace dockhand::transport
