#pragma once

#include <memory>

#include <absl/status/statusor.h>
#include <boost/asio/ssl/context.hpp>
#include <grpcpp/security/credentials.h>

#include "tether/client/connection.h"

namespace tether {

/// Credentials validated for one protocol. Exactly one of the transport
/// specific members is populated: grpc_credentials for Protocol::kGrpc,
/// ssl_context for Protocol::kHttp with TLS enabled.
struct ResolvedCredentials {
    Protocol protocol = Protocol::kGrpc;
    bool tls = false;
    bool mutual = false;
    bool verify_peer = false;

    std::shared_ptr<grpc::ChannelCredentials> grpc_credentials;
    std::shared_ptr<boost::asio::ssl::context> ssl_context;
};

// Validates the TLS block against the protocol's trust model and builds the
// credentials. All failures are configuration errors and happen before any
// network activity:
//   - gRPC has no "TLS without verification" mode, so insecure_verify is
//     rejected for Protocol::kGrpc;
//   - mTLS requires both cert_file and key_file;
//   - referenced files must be readable PEM.
absl::StatusOr<ResolvedCredentials> ResolveTransportSecurity(const TlsConfig& tls,
                                                             Protocol protocol);

}  // namespace tether
