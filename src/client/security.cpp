#include "tether/client/security.h"

#include <fstream>
#include <sstream>
#include <string>

#include <absl/log/log.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <boost/system/error_code.hpp>
#include <grpcpp/security/credentials.h>

#include "tether/common/error.h"

namespace tether {

namespace {

namespace ssl = boost::asio::ssl;

absl::StatusOr<std::string> ReadPemFile(const std::string& path, const char* what) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return ConfigurationError(absl::StrCat("cannot read ", what, " '", path, "'"));
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    std::string content = ss.str();
    if (!absl::StrContains(content, "-----BEGIN ")) {
        return ConfigurationError(absl::StrCat(what, " '", path, "' is not PEM encoded"));
    }
    return content;
}

absl::Status CheckMutualFiles(const TlsConfig& tls) {
    const bool has_cert = !tls.cert_file.empty();
    const bool has_key = !tls.key_file.empty();
    if (tls.mtls && (!has_cert || !has_key)) {
        return ConfigurationError("mTLS requires both cert_file and key_file");
    }
    if (has_cert != has_key) {
        return ConfigurationError(
            has_cert ? "cert_file given without key_file" : "key_file given without cert_file");
    }
    return absl::OkStatus();
}

absl::StatusOr<ResolvedCredentials> ResolveGrpc(const TlsConfig& tls) {
    if (tls.insecure_verify) {
        return ConfigurationError(
            "insecure_verify is not supported for grpc: the channel either verifies the "
            "server certificate or does not use TLS");
    }

    grpc::SslCredentialsOptions options;
    if (!tls.ca_file.empty()) {
        auto ca = ReadPemFile(tls.ca_file, "ca_file");
        if (!ca.ok()) {
            return ca.status();
        }
        options.pem_root_certs = std::move(*ca);
    }

    ResolvedCredentials resolved;
    resolved.protocol = Protocol::kGrpc;
    resolved.tls = true;
    resolved.verify_peer = true;
    resolved.mutual = tls.IsMutual();

    if (resolved.mutual) {
        auto cert = ReadPemFile(tls.cert_file, "cert_file");
        if (!cert.ok()) {
            return cert.status();
        }
        auto key = ReadPemFile(tls.key_file, "key_file");
        if (!key.ok()) {
            return key.status();
        }
        options.pem_cert_chain = std::move(*cert);
        options.pem_private_key = std::move(*key);
    }

    resolved.grpc_credentials = grpc::SslCredentials(options);
    if (!resolved.grpc_credentials) {
        return ConfigurationError("failed to build gRPC TLS credentials");
    }
    return resolved;
}

absl::StatusOr<ResolvedCredentials> ResolveHttp(const TlsConfig& tls) {
    auto context = std::make_shared<ssl::context>(ssl::context::tls_client);
    boost::system::error_code ec;

    context->set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 |
                             ssl::context::no_sslv3,
                         ec);
    if (ec) {
        return ConfigurationError(absl::StrCat("failed to configure TLS: ", ec.message()));
    }

    ResolvedCredentials resolved;
    resolved.protocol = Protocol::kHttp;
    resolved.tls = true;
    resolved.verify_peer = !tls.insecure_verify;
    resolved.mutual = tls.IsMutual();

    if (resolved.verify_peer) {
        context->set_verify_mode(ssl::verify_peer, ec);
        if (!ec) {
            if (tls.ca_file.empty()) {
                context->set_default_verify_paths(ec);
            } else {
                auto ca = ReadPemFile(tls.ca_file, "ca_file");
                if (!ca.ok()) {
                    return ca.status();
                }
                context->load_verify_file(tls.ca_file, ec);
            }
        }
        if (ec) {
            return ConfigurationError(
                absl::StrCat("failed to load server trust roots: ", ec.message()));
        }
    } else {
        LOG(WARNING) << "[TLS] Server certificate verification is disabled";
        context->set_verify_mode(ssl::verify_none, ec);
        if (ec) {
            return ConfigurationError(absl::StrCat("failed to configure TLS: ", ec.message()));
        }
    }

    if (resolved.mutual) {
        context->use_certificate_chain_file(tls.cert_file, ec);
        if (ec) {
            return ConfigurationError(absl::StrCat("cannot load cert_file '", tls.cert_file,
                                                   "': ", ec.message()));
        }
        context->use_private_key_file(tls.key_file, ssl::context::pem, ec);
        if (ec) {
            return ConfigurationError(absl::StrCat("cannot load key_file '", tls.key_file,
                                                   "': ", ec.message()));
        }
    }

    resolved.ssl_context = std::move(context);
    return resolved;
}

}  // namespace

absl::StatusOr<ResolvedCredentials> ResolveTransportSecurity(const TlsConfig& tls,
                                                             Protocol protocol) {
    if (!tls.enabled) {
        ResolvedCredentials resolved;
        resolved.protocol = protocol;
        if (protocol == Protocol::kGrpc) {
            resolved.grpc_credentials = grpc::InsecureChannelCredentials();
        }
        return resolved;
    }

    auto status = CheckMutualFiles(tls);
    if (!status.ok()) {
        return status;
    }

    switch (protocol) {
    case Protocol::kGrpc:
        return ResolveGrpc(tls);
    case Protocol::kHttp:
        return ResolveHttp(tls);
    }
    return ConfigurationError("unknown protocol");
}

}  // namespace tether
