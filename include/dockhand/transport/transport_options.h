#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

#include <dockhand/core/types.h>

namespace dockhand::transport {

// Client certificate material for https endpoints. Owned by one Connection.
struct TlsConfig {
    std::filesystem::path certFile;
    std::filesystem::path keyFile;
    std::filesystem::path caFile;
    bool verify{true};
    // Overrides the SNI / verification host name; defaults to the endpoint host.
    std::string serverName;

    bool hasClientCertificate() const { return !certFile.empty() && !keyFile.empty(); }

    // Layout used by Docker and Podman: cert.pem, key.pem and (when verifying) ca.pem.
    static TlsConfig fromCertDirectory(const std::filesystem::path& dir, bool verify) {
        TlsConfig cfg;
        cfg.certFile = dir / "cert.pem";
        cfg.keyFile = dir / "key.pem";
        if (verify) {
            cfg.caFile = dir / "ca.pem";
        }
        cfg.verify = verify;
        return cfg;
    }
};

struct ConnectionOptions {
    // Deadline for resolve, connect and TLS handshake; zero disables it.
    std::chrono::milliseconds connectTimeout{10000};
    // Deadline for writing the request and reading the response header; zero disables it.
    std::chrono::milliseconds headerTimeout{30000};
    // Idle deadline for each body read. Event streams may stay silent for long stretches,
    // so the default is none.
    std::chrono::milliseconds bodyTimeout{0};
    std::size_t maxBodySize{DEFAULT_MAX_BODY_SIZE};
    std::size_t maxIdleStreams{4};
    std::string userAgent{"dockhand/0.9"};
    TlsConfig tls;
};

} // namespace dockhand::transport
