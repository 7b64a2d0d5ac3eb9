#include <dockhand/http/api_version.h>

#include <charconv>
#include <vector>

#include <spdlog/fmt/fmt.h>

namespace dockhand::http {

namespace {
std::optional<std::uint32_t> parseComponent(std::string_view s) {
    std::uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size() || s.empty()) {
        return std::nullopt;
    }
    return value;
}
} // namespace

Result<ApiVersion> ApiVersion::parse(std::string_view text) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        auto dot = text.find('.', start);
        parts.push_back(text.substr(start, dot == std::string_view::npos ? dot : dot - start));
        if (dot == std::string_view::npos)
            break;
        start = dot + 1;
    }

    if (parts.size() > 3) {
        return Error{ErrorCode::Serialization,
                     fmt::format("Invalid version '{}': unexpected extra tokens", text)};
    }
    auto major = parseComponent(parts[0]);
    if (!major) {
        return Error{ErrorCode::Serialization,
                     fmt::format("Invalid version '{}': expected major version", text)};
    }
    std::optional<std::uint32_t> minor;
    std::optional<std::uint32_t> patch;
    if (parts.size() > 1)
        minor = parseComponent(parts[1]);
    if (parts.size() > 2)
        patch = parseComponent(parts[2]);
    return ApiVersion{*major, minor, patch};
}

std::string ApiVersion::toString() const {
    std::string out = std::to_string(major_);
    if (minor_) {
        out += fmt::format(".{}", *minor_);
    }
    if (patch_) {
        out += fmt::format(".{}", *patch_);
    }
    return out;
}

std::string ApiVersion::makeEndpoint(std::string_view endpoint) const {
    return fmt::format("/v{}{}{}", toString(), endpoint.starts_with('/') ? "" : "/", endpoint);
}

} // namespace dockhand::http
