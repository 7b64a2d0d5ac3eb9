#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <dockhand/core/types.h>

namespace dockhand::http {

// Daemon API version, major[.minor[.patch]]. Ordered so callers can gate features.
class ApiVersion {
public:
    constexpr explicit ApiVersion(std::uint32_t major,
                                  std::optional<std::uint32_t> minor = std::nullopt,
                                  std::optional<std::uint32_t> patch = std::nullopt)
        : major_(major), minor_(minor), patch_(patch) {}

    // Non-numeric minor or patch components are dropped; more than three components or a
    // non-numeric major fail with ErrorCode::Serialization.
    static Result<ApiVersion> parse(std::string_view text);

    std::uint32_t majorVersion() const noexcept { return major_; }
    std::optional<std::uint32_t> minorVersion() const noexcept { return minor_; }
    std::optional<std::uint32_t> patchVersion() const noexcept { return patch_; }

    std::string toString() const;

    // makeEndpoint("/info") == "/v1.41/info"
    std::string makeEndpoint(std::string_view endpoint) const;

    auto operator<=>(const ApiVersion&) const = default;

private:
    std::uint32_t major_;
    std::optional<std::uint32_t> minor_;
    std::optional<std::uint32_t> patch_;
};

} // namespace dockhand::http
