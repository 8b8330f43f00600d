#pragma once

#include <memory>
#include <string>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <boost/asio/ssl/context.hpp>

#include "tether/client/protocol_client.h"

namespace tether {

/// Protocol client over HTTP/1.1 with JSON bodies.
///
/// Requests are `POST <route>` with `{"model_id": <target>, "inputs": ...}`.
/// Stream-out responses are read as server-sent events (or newline
/// delimited JSON) and decoded one message per event. HTTP has no client
/// streaming, so stream-in materialises the whole input sequence into one
/// batch request first: the sequence must be finite, and its encoded size
/// is bounded by ClientOptions::max_batch_bytes.
///
/// Each call uses its own connection, so calls never share mutable state.
class HTTPClient final : public IProtocolClient {
public:
    HTTPClient(ConnectionDescriptor connection,
               std::shared_ptr<boost::asio::ssl::context> ssl_context,
               bool verify_peer,
               ClientOptions options);
    ~HTTPClient() override;

    HTTPClient(const HTTPClient&) = delete;
    HTTPClient& operator=(const HTTPClient&) = delete;

    static absl::StatusOr<std::unique_ptr<HTTPClient>> Create(
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

    // Request bodies, exposed for inspection.
    absl::StatusOr<std::string> EncodeRequest(const google::protobuf::Message& input) const;
    absl::StatusOr<std::string> EncodeBatchRequest(InputStream& inputs) const;

private:
    absl::StatusOr<std::unique_ptr<google::protobuf::Message>> Exchange(
        const OperationShape& shape,
        std::string body);

    ConnectionDescriptor connection_;
    std::shared_ptr<boost::asio::ssl::context> ssl_context_;
    bool verify_peer_;
    ClientOptions options_;
};

// Decode a JSON body into a new message of |type|. Unknown fields are ignored.
absl::StatusOr<std::unique_ptr<google::protobuf::Message>> DecodeJsonMessage(
    const std::string& json,
    const google::protobuf::Descriptor* type);

}  // namespace tether
