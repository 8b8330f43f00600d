#include "tether/client/connection.h"

#include <fstream>
#include <sstream>
#include <utility>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

#include "json_fields.h"
#include "tether/common/error.h"

namespace tether {

using internal::EraseJsonObjectField;
using internal::ExtractJsonBoolField;
using internal::ExtractJsonIntField;
using internal::ExtractJsonObjectField;
using internal::ExtractJsonStringField;

namespace {

TlsConfig ParseTlsBlock(const std::string& text) {
    TlsConfig tls;
    if (auto v = ExtractJsonBoolField(text, "enabled")) {
        tls.enabled = *v;
    }
    if (auto v = ExtractJsonBoolField(text, "mtls")) {
        tls.mtls = *v;
    }
    if (auto v = ExtractJsonStringField(text, "ca_file")) {
        tls.ca_file = *v;
    }
    if (auto v = ExtractJsonStringField(text, "cert_file")) {
        tls.cert_file = *v;
    }
    if (auto v = ExtractJsonStringField(text, "key_file")) {
        tls.key_file = *v;
    }
    if (auto v = ExtractJsonBoolField(text, "insecure_verify")) {
        tls.insecure_verify = *v;
    }
    return tls;
}

}  // namespace

absl::StatusOr<Protocol> ParseProtocol(absl::string_view name) {
    const std::string lowered = absl::AsciiStrToLower(name);
    if (lowered == "grpc") {
        return Protocol::kGrpc;
    }
    if (lowered == "http") {
        return Protocol::kHttp;
    }
    return ConfigurationError(absl::StrCat("unknown protocol '", name, "', expected grpc or http"));
}

const char* ProtocolName(Protocol protocol) {
    switch (protocol) {
    case Protocol::kGrpc: return "grpc";
    case Protocol::kHttp: return "http";
    }
    return "unknown";
}

absl::StatusOr<ConnectionDescriptor> ConnectionDescriptor::Create(
    std::string host,
    int port,
    Protocol protocol,
    TlsConfig tls,
    std::optional<std::chrono::milliseconds> timeout) {

    if (host.empty()) {
        return ConfigurationError("connection host must not be empty");
    }
    if (port < kMinPort || port > kMaxPort) {
        return ConfigurationError(absl::StrCat("connection port ", port, " is outside [",
                                               kMinPort, ", ", kMaxPort, "]"));
    }
    if (protocol != Protocol::kGrpc && protocol != Protocol::kHttp) {
        return ConfigurationError("unknown connection protocol");
    }
    if (timeout.has_value() && timeout->count() <= 0) {
        return ConfigurationError("connection timeout must be positive");
    }
    return ConnectionDescriptor(std::move(host), port, protocol, std::move(tls), timeout);
}

ConnectionDescriptor::ConnectionDescriptor(std::string host, int port, Protocol protocol,
                                           TlsConfig tls,
                                           std::optional<std::chrono::milliseconds> timeout)
    : host_(std::move(host)),
      port_(port),
      protocol_(protocol),
      tls_(std::move(tls)),
      timeout_(timeout) {
}

const std::string& ConnectionDescriptor::GetHost() const {
    return host_;
}

int ConnectionDescriptor::GetPort() const {
    return port_;
}

Protocol ConnectionDescriptor::GetProtocol() const {
    return protocol_;
}

const TlsConfig& ConnectionDescriptor::GetTls() const {
    return tls_;
}

const std::optional<std::chrono::milliseconds>& ConnectionDescriptor::GetTimeout() const {
    return timeout_;
}

std::string ConnectionDescriptor::GetTarget() const {
    if (host_.find(':') != std::string::npos && host_.front() != '[') {
        return absl::StrCat("[", host_, "]:", port_);
    }
    return absl::StrCat(host_, ":", port_);
}

absl::StatusOr<ConnectionDescriptor> ParseConnectionDescriptor(const std::string& json_text) {
    TlsConfig tls;
    if (auto block = ExtractJsonObjectField(json_text, "tls")) {
        tls = ParseTlsBlock(*block);
    }
    // Top-level fields are read with the tls block removed.
    const std::string text = EraseJsonObjectField(json_text, "tls");

    std::optional<std::string> host = ExtractJsonStringField(text, "hostname");
    if (!host) {
        host = ExtractJsonStringField(text, "host");
    }
    if (!host) {
        return ConfigurationError("connection info is missing 'hostname'");
    }

    auto port = ExtractJsonIntField(text, "port");
    if (!port) {
        return ConfigurationError("connection info is missing an integer 'port'");
    }
    if (*port < ConnectionDescriptor::kMinPort || *port > ConnectionDescriptor::kMaxPort) {
        return ConfigurationError(absl::StrCat("connection port ", *port, " is out of range"));
    }

    Protocol protocol = Protocol::kGrpc;
    if (auto v = ExtractJsonStringField(text, "protocol")) {
        auto parsed = ParseProtocol(*v);
        if (!parsed.ok()) {
            return parsed.status();
        }
        protocol = *parsed;
    }

    std::optional<std::chrono::milliseconds> timeout;
    if (auto v = ExtractJsonIntField(text, "timeout_ms")) {
        timeout = std::chrono::milliseconds(*v);
    }

    return ConnectionDescriptor::Create(std::move(*host), static_cast<int>(*port), protocol,
                                        std::move(tls), timeout);
}

absl::StatusOr<ConnectionDescriptor> LoadConnectionDescriptor(
    const std::filesystem::path& config_file) {
    std::ifstream in(config_file);
    if (!in.is_open()) {
        return WithErrorKind(
            absl::NotFoundError(absl::StrCat("connection info file not found: ",
                                             config_file.string())),
            ErrorKind::kConfiguration);
    }

    std::ostringstream ss;
    ss << in.rdbuf();
    return ParseConnectionDescriptor(ss.str());
}

}  // namespace tether
