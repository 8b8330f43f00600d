#pragma once

#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "tether/client/protocol_client.h"

namespace tether {

/// Protocol client over one persistent gRPC channel. Calls are generic
/// (raw protobuf bytes in grpc::ByteBuffer), so any target can be reached
/// without a generated stub.
class GRPCClient final : public IProtocolClient {
public:
    // Model routing header understood by the remote runtime.
    static constexpr char kModelIdMetadata[] = "mm-model-id";

    GRPCClient(std::shared_ptr<grpc::Channel> channel, ClientOptions options);
    ~GRPCClient() override;

    GRPCClient(const GRPCClient&) = delete;
    GRPCClient& operator=(const GRPCClient&) = delete;
    GRPCClient(GRPCClient&&) = delete;
    GRPCClient& operator=(GRPCClient&&) = delete;

    // Creates the channel; gRPC connects lazily on the first call.
    static absl::StatusOr<std::unique_ptr<GRPCClient>> Create(
        const ConnectionDescriptor& connection,
        const ResolvedCredentials& credentials,
        const ClientOptions& options);

    Protocol GetProtocol() const override;

    absl::StatusOr<std::unique_ptr<google::protobuf::Message>> CallUnary(
        const OperationShape& shape,
        const google::protobuf::Message& input) override;

    absl::StatusOr<std::unique_ptr<google::protobuf::Message>> CallStreamIn(
        const OperationShape& shape,
        InputStream& inputs) override;

    absl::StatusOr<std::unique_ptr<OutputStream>> CallStreamOut(
        const OperationShape& shape,
        const google::protobuf::Message& input) override;

    grpc_connectivity_state GetChannelState() const;

private:
    void PrepareContext(grpc::ClientContext* context) const;

    std::shared_ptr<grpc::Channel> channel_;
    ClientOptions options_;
};

// Convert a failed gRPC status into the layer's error kinds.
absl::Status FromGrpcStatus(const grpc::Status& status);

}  // namespace tether
