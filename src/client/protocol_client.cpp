#include "tether/client/protocol_client.h"

#include "tether/client/grpc_client.h"
#include "tether/client/http_client.h"
#include "tether/common/error.h"

namespace tether {

absl::StatusOr<std::unique_ptr<IProtocolClient>> CreateProtocolClient(
    const ConnectionDescriptor& connection,
    const ResolvedCredentials& credentials,
    const ClientOptions& options) {

    if (credentials.protocol != connection.GetProtocol()) {
        return ConfigurationError("credentials were resolved for a different protocol");
    }

    switch (connection.GetProtocol()) {
    case Protocol::kGrpc: {
        auto client = GRPCClient::Create(connection, credentials, options);
        if (!client.ok()) {
            return client.status();
        }
        return std::unique_ptr<IProtocolClient>(std::move(*client));
    }
    case Protocol::kHttp: {
        auto client = HTTPClient::Create(connection, credentials, options);
        if (!client.ok()) {
            return client.status();
        }
        return std::unique_ptr<IProtocolClient>(std::move(*client));
    }
    }
    return ConfigurationError("unsupported protocol");
}

}  // namespace tether
