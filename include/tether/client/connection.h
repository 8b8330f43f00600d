#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/string_view.h>

namespace tether {

enum class Protocol {
    kGrpc,
    kHttp
};

// Accepts "grpc" and "http" (case-insensitive).
absl::StatusOr<Protocol> ParseProtocol(absl::string_view name);
const char* ProtocolName(Protocol protocol);

/// Transport security block of a connection. Files are referenced by path;
/// they are read when the connection's credentials are resolved.
struct TlsConfig {
    bool enabled = false;
    bool mtls = false;            // Explicit request for a client certificate
    std::string ca_file;          // Empty means system trust roots
    std::string cert_file;
    std::string key_file;
    bool insecure_verify = false; // Skip server certificate verification

    // mTLS is requested explicitly or implied by a client certificate and key.
    bool IsMutual() const {
        return mtls || (!cert_file.empty() && !key_file.empty());
    }
};

/// Address, protocol and transport security of one remote endpoint.
/// Immutable once created.
class ConnectionDescriptor {
public:
    static constexpr int kMinPort = 1;
    static constexpr int kMaxPort = 65535;

    // Rejects an empty host and ports outside [1, 65535] with a
    // configuration error.
    static absl::StatusOr<ConnectionDescriptor> Create(
        std::string host,
        int port,
        Protocol protocol,
        TlsConfig tls = {},
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    const std::string& GetHost() const;
    int GetPort() const;
    Protocol GetProtocol() const;
    const TlsConfig& GetTls() const;
    const std::optional<std::chrono::milliseconds>& GetTimeout() const;

    // "host:port", with IPv6 literals bracketed.
    std::string GetTarget() const;

private:
    ConnectionDescriptor(std::string host, int port, Protocol protocol, TlsConfig tls,
                         std::optional<std::chrono::milliseconds> timeout);

    std::string host_;
    int port_;
    Protocol protocol_;
    TlsConfig tls_;
    std::optional<std::chrono::milliseconds> timeout_;
};

// Parse a connection-info document:
//   {
//     "hostname": "localhost", "port": 8085, "protocol": "grpc",
//     "timeout_ms": 5000,
//     "tls": {"enabled": true, "ca_file": "...", "cert_file": "...",
//             "key_file": "...", "mtls": false, "insecure_verify": false}
//   }
// "host" is accepted as an alias of "hostname"; "protocol" defaults to grpc.
absl::StatusOr<ConnectionDescriptor> ParseConnectionDescriptor(const std::string& json_text);

absl::StatusOr<ConnectionDescriptor> LoadConnectionDescriptor(
    const std::filesystem::path& config_file);

}  // namespace tether
