#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <dockhand/archive/archive_options.h>
#include <dockhand/core/types.h>
#include <dockhand/transport/endpoint.h>
#include <dockhand/transport/transport_options.h>

namespace dockhand::config {

inline constexpr std::string_view kDefaultHost = "unix:///var/run/docker.sock";

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// "~" and "~/..." expand against $HOME.
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~' && (path.size() == 1 || path[1] == '/')) {
        if (const char* home = std::getenv("HOME")) {
            return path.size() <= 2 ? std::filesystem::path(home)
                                    : std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Non-empty environment variable, or nullopt.
inline std::optional<std::string> env_value(const char* name) {
    if (const char* v = std::getenv(name); v && *v) {
        return std::string(v);
    }
    return std::nullopt;
}

// Parse a value from a TOML config file ("[section] key = value" or "section.key = value").
// Returns an empty string when the file, section or key is missing.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// override_path, else $XDG_CONFIG_HOME/dockhand/config.toml or ~/.config/dockhand/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

// Unsigned decimal; nullopt on anything else.
std::optional<std::uint64_t> parse_unsigned(std::string_view text);

// Truthy values accepted in env and config: 1, true, yes, on (case-insensitive).
bool parse_bool(std::string_view text);

struct ClientConfig {
    transport::Endpoint endpoint;
    transport::ConnectionOptions connection;
    archive::ArchiveOptions archiveOptions;
    // File the settings were read from, empty when none existed.
    std::filesystem::path source;
};

// Resolves daemon address, TLS material, timeouts and archive settings.
// Precedence is environment, then config file ($DOCKHAND_CONFIG or get_config_path()),
// then built-in defaults.
Result<ClientConfig> resolveClientConfig(const std::string& override_path = "");

} // namespace dockhand::config
