#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <variant>

#include <dockhand/core/types.h>

namespace dockhand::transport {

enum class Scheme { Http, Https };

struct UnixSocket {
    std::filesystem::path path;

    bool operator==(const UnixSocket&) const = default;
};

struct Tcp {
    std::string host;
    std::uint16_t port{0};
    Scheme scheme{Scheme::Http};

    bool operator==(const Tcp&) const = default;
};

// Logical address of the daemon. Immutable once parsed.
class Endpoint {
public:
    using Address = std::variant<UnixSocket, Tcp>;

    // Accepts unix://<path>, http://<host>[:<port>] and https://<host>[:<port>].
    static Result<Endpoint> parse(std::string_view text);

    static Endpoint forUnix(std::filesystem::path path);
    static Endpoint forTcp(std::string host, std::uint16_t port, Scheme scheme = Scheme::Http);

    bool isUnix() const noexcept { return std::holds_alternative<UnixSocket>(address_); }
    bool isTcp() const noexcept { return std::holds_alternative<Tcp>(address_); }
    bool isSecure() const noexcept;

    const UnixSocket& unixSocket() const { return std::get<UnixSocket>(address_); }
    const Tcp& tcp() const { return std::get<Tcp>(address_); }
    const Address& address() const noexcept { return address_; }

    // Canonical configuration string, parse(toString()) == *this.
    std::string toString() const;
    // Socket path for Unix endpoints, scheme://host:port otherwise.
    std::string remoteAddr() const;
    // Value for the HTTP Host header.
    std::string hostHeader() const;

    bool operator==(const Endpoint&) const = default;

private:
    explicit Endpoint(Address address) : address_(std::move(address)) {}

    Address address_;
};

constexpr std::uint16_t defaultPort(Scheme scheme) {
    return scheme == Scheme::Https ? 443 : 80;
}

constexpr std::string_view schemeName(Scheme scheme) {
    return scheme == Scheme::Https ? "https" : "http";
}

} // namespace dockhand::transport
