#include <charconv>
#include <fstream>
#include <dockhand/config/config_helpers.h>

#include <spdlog/spdlog.h>

namespace dockhand::config {

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();
    const std::string dotted = section.empty() ? key : section + "." + key;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments outside quotes
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        // Top-level "client.host" works as well as "[client] host"
        if ((in_target_section && k == key) || (currentSection.empty() && k == dotted)) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return {};
    }

    return configHome / "dockhand" / "config.toml";
}

std::optional<std::uint64_t> parse_unsigned(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

bool parse_bool(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

namespace {

// Reads [section] key from the config file, if there is one.
class FileSettings {
public:
    explicit FileSettings(std::filesystem::path path) : path_(std::move(path)) {
        std::error_code ec;
        present_ = !path_.empty() && std::filesystem::is_regular_file(path_, ec);
    }

    bool present() const { return present_; }
    const std::filesystem::path& path() const { return path_; }

    std::string get(const std::string& section, const std::string& key) const {
        return present_ ? parse_config_value(path_, section, key) : std::string{};
    }

    // Applies a numeric setting; malformed values keep the default.
    template <typename Fn>
    void number(const std::string& section, const std::string& key, Fn&& apply) const {
        auto raw = get(section, key);
        if (raw.empty()) {
            return;
        }
        if (auto v = parse_unsigned(raw)) {
            apply(*v);
        } else {
            spdlog::warn("Config {}: ignoring non-numeric [{}] {} = '{}'", path_.string(), section,
                         key, raw);
        }
    }

private:
    std::filesystem::path path_;
    bool present_{false};
};

constexpr std::string_view kTcpPrefix = "tcp://";

} // namespace

Result<ClientConfig> resolveClientConfig(const std::string& override_path) {
    std::string configOverride = override_path;
    if (configOverride.empty()) {
        configOverride = env_value("DOCKHAND_CONFIG").value_or("");
    }
    FileSettings file(get_config_path(configOverride));
    if (file.present()) {
        spdlog::debug("Reading client config from {}", file.path().string());
    }

    // 1) Host: DOCKHAND_HOST, DOCKER_HOST, [client] host, default socket
    std::string host;
    if (auto v = env_value("DOCKHAND_HOST")) {
        host = *v;
    } else if (auto docker = env_value("DOCKER_HOST")) {
        host = *docker;
    } else if (auto fromFile = file.get("client", "host"); !fromFile.empty()) {
        host = fromFile;
    } else {
        host = std::string(kDefaultHost);
    }

    // 2) TLS material, Docker CLI conventions first
    std::filesystem::path certPath;
    if (auto v = env_value("DOCKER_CERT_PATH")) {
        certPath = expand_tilde(*v);
    } else if (auto fromFile = file.get("tls", "cert_path"); !fromFile.empty()) {
        certPath = expand_tilde(fromFile);
    }
    std::optional<bool> verifySetting;
    if (env_value("DOCKER_TLS_VERIFY")) {
        verifySetting = true;
    } else if (auto fromFile = file.get("tls", "verify"); !fromFile.empty()) {
        verifySetting = parse_bool(fromFile);
    }
    const bool wantTls = verifySetting.value_or(false) || !certPath.empty();

    // tcp:// is the Docker CLI spelling; TLS settings pick the scheme.
    if (host.starts_with(kTcpPrefix)) {
        host = std::string(wantTls ? "https://" : "http://") + host.substr(kTcpPrefix.size());
    }
    auto endpoint = transport::Endpoint::parse(host);
    if (!endpoint) {
        return endpoint.error();
    }

    transport::ConnectionOptions connection;
    // A cert directory without DOCKER_TLS_VERIFY means encrypted but unverified.
    const bool verify = verifySetting.value_or(certPath.empty());
    if (!certPath.empty()) {
        connection.tls = transport::TlsConfig::fromCertDirectory(certPath, verify);
    } else {
        connection.tls.verify = verify;
    }
    if (auto name = file.get("tls", "server_name"); !name.empty()) {
        connection.tls.serverName = name;
    }

    // 3) Timeouts and limits
    using std::chrono::milliseconds;
    file.number("client", "timeout_ms",
                [&](std::uint64_t v) { connection.headerTimeout = milliseconds(v); });
    file.number("client", "body_timeout_ms",
                [&](std::uint64_t v) { connection.bodyTimeout = milliseconds(v); });
    file.number("client", "connect_timeout_ms",
                [&](std::uint64_t v) { connection.connectTimeout = milliseconds(v); });
    file.number("client", "max_body_bytes",
                [&](std::uint64_t v) { connection.maxBodySize = static_cast<std::size_t>(v); });
    file.number("client", "max_idle_streams",
                [&](std::uint64_t v) { connection.maxIdleStreams = static_cast<std::size_t>(v); });
    if (auto ua = file.get("client", "user_agent"); !ua.empty()) {
        connection.userAgent = ua;
    }

    // 4) Archive settings
    archive::ArchiveOptions archiveOptions;
    file.number("archive", "chunk_size",
                [&](std::uint64_t v) { archiveOptions.chunkSize = static_cast<std::size_t>(v); });
    file.number("archive", "workers",
                [&](std::uint64_t v) { archiveOptions.workers = static_cast<std::size_t>(v); });
    file.number("archive", "level", [&](std::uint64_t v) {
        archiveOptions.level = static_cast<int>(std::min<std::uint64_t>(v, 9));
    });
    if (auto mode = file.get("archive", "compression"); !mode.empty()) {
        if (mode == "none") {
            archiveOptions.compression = archive::Compression::None;
        } else if (mode == "serial" || mode == "gzip") {
            archiveOptions.compression = archive::Compression::Serial;
        } else if (mode == "parallel") {
            archiveOptions.compression = archive::Compression::Parallel;
        } else {
            spdlog::warn("Config {}: unknown [archive] compression '{}'", file.path().string(),
                         mode);
        }
    }
    if (auto follow = file.get("archive", "follow_symlinks"); !follow.empty()) {
        archiveOptions.followSymlinks = parse_bool(follow);
    }

    spdlog::debug("Client config: endpoint {}", endpoint.value().toString());
    return ClientConfig{std::move(endpoint).value(), std::move(connection), archiveOptions,
                        file.present() ? file.path() : std::filesystem::path{}};
}

} // namespace dockhand::config
