#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include <absl/status/statusor.h>
#include <google/protobuf/message.h>

#include "tether/client/connection.h"
#include "tether/client/security.h"
#include "tether/client/signature.h"
#include "tether/client/streams.h"

namespace tether {

/// Settings shared by every call a protocol client makes.
struct ClientOptions {
    std::string target_id;
    std::optional<std::chrono::milliseconds> timeout;  // Per call, not per client
    size_t max_message_size = 16 * 1024 * 1024;        // 16 MB
    size_t max_batch_bytes = 16 * 1024 * 1024;         // HTTP stream-in emulation bound
    std::string user_agent = "tether-client";
};

/* A protocol client performs the three call shapes over one transport. */
/* Implementations are created once per proxy and never mutated after, so */
/* concurrent calls from several threads are allowed. */
class IProtocolClient {
public:
    virtual ~IProtocolClient() = default;

    virtual Protocol GetProtocol() const = 0;

    virtual absl::StatusOr<std::unique_ptr<google::protobuf::Message>> CallUnary(
        const OperationShape& shape,
        const google::protobuf::Message& input) = 0;

    virtual absl::StatusOr<std::unique_ptr<google::protobuf::Message>> CallStreamIn(
        const OperationShape& shape,
        InputStream& inputs) = 0;

    virtual absl::StatusOr<std::unique_ptr<OutputStream>> CallStreamOut(
        const OperationShape& shape,
        const google::protobuf::Message& input) = 0;
};

// Build the client variant for |connection|'s protocol. No network I/O.
absl::StatusOr<std::unique_ptr<IProtocolClient>> CreateProtocolClient(
    const ConnectionDescriptor& connection,
    const ResolvedCredentials& credentials,
    const ClientOptions& options);

}  // namespace tether
