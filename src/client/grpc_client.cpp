#include "tether/client/grpc_client.h"

#include <utility>
#include <vector>

#include <absl/log/log.h>
#include <absl/log/vlog_is_on.h>
#include <absl/strings/str_cat.h>
#include <grpcpp/impl/client_unary_call.h>
#include <grpcpp/impl/rpc_method.h>
#include <grpcpp/support/byte_buffer.h>
#include <grpcpp/support/sync_stream.h>

#include "tether/common/error.h"

namespace tether {

namespace {

absl::Status SerializeToByteBuffer(const google::protobuf::Message& message,
                                   grpc::ByteBuffer* buffer) {
    std::string bytes;
    if (!message.SerializeToString(&bytes)) {
        return ConfigurationError(
            absl::StrCat("failed to serialize ", message.GetTypeName()));
    }
    grpc::Slice slice(bytes);
    *buffer = grpc::ByteBuffer(&slice, 1);
    return absl::OkStatus();
}

absl::StatusOr<std::unique_ptr<google::protobuf::Message>> ParseFromByteBuffer(
    const grpc::ByteBuffer& buffer,
    const google::protobuf::Descriptor* type) {
    auto message = NewMessage(type);
    if (!message) {
        return absl::InternalError("no message factory for response type");
    }

    std::vector<grpc::Slice> slices;
    grpc::Status dump_status = buffer.Dump(&slices);
    if (!dump_status.ok()) {
        return FromGrpcStatus(dump_status);
    }
    std::string bytes;
    bytes.reserve(buffer.Length());
    for (const auto& slice : slices) {
        bytes.append(reinterpret_cast<const char*>(slice.begin()), slice.size());
    }

    if (!message->ParseFromString(bytes)) {
        return RemoteError(absl::StatusCode::kInternal,
                           absl::StrCat("malformed ", type->full_name(), " from server"));
    }
    return message;
}

/// Server-streaming call. Owns its context; cancelling or destroying the
/// stream cancels the call and collects its status.
class GrpcOutputStream final : public OutputStreamBase {
public:
    GrpcOutputStream(std::shared_ptr<grpc::Channel> channel,
                     std::unique_ptr<grpc::ClientContext> context,
                     const std::string& method_name,
                     const grpc::ByteBuffer& request,
                     const google::protobuf::Descriptor* output_type)
        : channel_(std::move(channel)),
          context_(std::move(context)),
          method_name_(method_name),
          method_(method_name_.c_str(), grpc::internal::RpcMethod::SERVER_STREAMING),
          output_type_(output_type) {
        reader_.reset(grpc::internal::ClientReaderFactory<grpc::ByteBuffer>::Create(
            channel_.get(), method_, context_.get(), request));
    }

    ~GrpcOutputStream() override {
        Cancel();
    }

protected:
    absl::StatusOr<std::unique_ptr<google::protobuf::Message>> Pull() override {
        grpc::ByteBuffer buffer;
        if (reader_->Read(&buffer)) {
            return ParseFromByteBuffer(buffer, output_type_);
        }

        grpc::Status status = reader_->Finish();
        finished_ = true;
        if (!status.ok()) {
            LOG(WARNING) << "[gRPC] <-- " << method_name_ << " stream failed: "
                         << status.error_message();
            return FromGrpcStatus(status);
        }
        LOG(INFO) << "[gRPC] <-- " << method_name_ << " stream closed";
        return std::unique_ptr<google::protobuf::Message>();
    }

    void Release() override {
        if (finished_) {
            return;
        }
        context_->TryCancel();
        grpc::Status status = reader_->Finish();
        finished_ = true;
        LOG(INFO) << "[gRPC] " << method_name_ << " stream abandoned after "
                  << GetDeliveredCount() << " message(s): " << status.error_message();
    }

private:
    std::shared_ptr<grpc::Channel> channel_;
    std::unique_ptr<grpc::ClientContext> context_;
    std::string method_name_;
    grpc::internal::RpcMethod method_;
    const google::protobuf::Descriptor* output_type_;
    std::unique_ptr<grpc::ClientReader<grpc::ByteBuffer>> reader_;
    bool finished_ = false;
};

}  // namespace

absl::Status FromGrpcStatus(const grpc::Status& status) {
    if (status.ok()) {
        return absl::OkStatus();
    }
    switch (status.error_code()) {
    case grpc::StatusCode::UNAVAILABLE:
        return ConnectionError(status.error_message());
    case grpc::StatusCode::DEADLINE_EXCEEDED:
        return TimeoutError(status.error_message());
    default:
        return RemoteError(static_cast<absl::StatusCode>(status.error_code()),
                           status.error_message());
    }
}

GRPCClient::GRPCClient(std::shared_ptr<grpc::Channel> channel, ClientOptions options)
    : channel_(std::move(channel)),
      options_(std::move(options)) {}

GRPCClient::~GRPCClient() = default;

absl::StatusOr<std::unique_ptr<GRPCClient>> GRPCClient::Create(
    const ConnectionDescriptor& connection,
    const ResolvedCredentials& credentials,
    const ClientOptions& options) {

    if (!credentials.grpc_credentials) {
        return ConfigurationError("gRPC channel credentials were not resolved");
    }

    grpc::ChannelArguments args;
    args.SetMaxReceiveMessageSize(static_cast<int>(options.max_message_size));
    args.SetMaxSendMessageSize(static_cast<int>(options.max_message_size));
    args.SetUserAgentPrefix(options.user_agent);

    auto channel = grpc::CreateCustomChannel(connection.GetTarget(),
                                             credentials.grpc_credentials, args);
    if (!channel) {
        return absl::InternalError("Failed to create gRPC channel");
    }

    LOG(INFO) << "[gRPC] Channel to " << connection.GetTarget()
              << (credentials.tls ? (credentials.mutual ? " (mTLS)" : " (TLS)") : " (plaintext)");
    return std::make_unique<GRPCClient>(std::move(channel), options);
}

Protocol GRPCClient::GetProtocol() const {
    return Protocol::kGrpc;
}

grpc_connectivity_state GRPCClient::GetChannelState() const {
    return channel_->GetState(false);
}

void GRPCClient::PrepareContext(grpc::ClientContext* context) const {
    if (!options_.target_id.empty()) {
        context->AddMetadata(kModelIdMetadata, options_.target_id);
    }
    if (options_.timeout.has_value()) {
        context->set_deadline(std::chrono::system_clock::now() + *options_.timeout);
    }
}

absl::StatusOr<std::unique_ptr<google::protobuf::Message>> GRPCClient::CallUnary(
    const OperationShape& shape,
    const google::protobuf::Message& input) {

    grpc::ByteBuffer request;
    auto status = SerializeToByteBuffer(input, &request);
    if (!status.ok()) {
        return status;
    }

    grpc::ClientContext context;
    PrepareContext(&context);
    grpc::internal::RpcMethod method(shape.rpc_method.c_str(),
                                     grpc::internal::RpcMethod::NORMAL_RPC);

    LOG(INFO) << "[gRPC] --> " << shape.rpc_method;
    VLOG(1) << "[gRPC] --> Content:\n" << input.DebugString();

    grpc::ByteBuffer response;
    grpc::Status call_status =
        grpc::internal::BlockingUnaryCall<grpc::ByteBuffer, grpc::ByteBuffer>(
            channel_.get(), method, &context, request, &response);
    if (!call_status.ok()) {
        LOG(WARNING) << "[gRPC] " << shape.rpc_method << " failed: "
                     << call_status.error_message();
        return FromGrpcStatus(call_status);
    }

    auto output = ParseFromByteBuffer(response, shape.output_type);
    if (output.ok()) {
        VLOG(1) << "[gRPC] <-- Content:\n" << (*output)->DebugString();
    }
    return output;
}

absl::StatusOr<std::unique_ptr<google::protobuf::Message>> GRPCClient::CallStreamIn(
    const OperationShape& shape,
    InputStream& inputs) {

    grpc::ClientContext context;
    PrepareContext(&context);
    grpc::internal::RpcMethod method(shape.rpc_method.c_str(),
                                     grpc::internal::RpcMethod::CLIENT_STREAMING);

    LOG(INFO) << "[gRPC] --> " << shape.rpc_method << " (client stream)";

    grpc::ByteBuffer response;
    std::unique_ptr<grpc::ClientWriter<grpc::ByteBuffer>> writer(
        grpc::internal::ClientWriterFactory<grpc::ByteBuffer>::Create(
            channel_.get(), method, &context, &response));

    absl::Status local_status;
    size_t sent = 0;
    while (const google::protobuf::Message* item = inputs.Next()) {
        grpc::ByteBuffer buffer;
        local_status = SerializeToByteBuffer(*item, &buffer);
        if (!local_status.ok()) {
            context.TryCancel();
            break;
        }
        if (!writer->Write(buffer)) {
            // The call is broken; Finish() reports why.
            break;
        }
        ++sent;
    }
    if (local_status.ok() && !inputs.GetStatus().ok()) {
        local_status = inputs.GetStatus();
        context.TryCancel();
    }
    if (local_status.ok()) {
        writer->WritesDone();
    }

    grpc::Status call_status = writer->Finish();
    if (!local_status.ok()) {
        return local_status;
    }
    if (!call_status.ok()) {
        LOG(WARNING) << "[gRPC] " << shape.rpc_method << " failed after " << sent
                     << " message(s): " << call_status.error_message();
        return FromGrpcStatus(call_status);
    }

    VLOG(1) << "[gRPC] " << shape.rpc_method << " sent " << sent << " message(s)";
    return ParseFromByteBuffer(response, shape.output_type);
}

absl::StatusOr<std::unique_ptr<OutputStream>> GRPCClient::CallStreamOut(
    const OperationShape& shape,
    const google::protobuf::Message& input) {

    grpc::ByteBuffer request;
    auto status = SerializeToByteBuffer(input, &request);
    if (!status.ok()) {
        return status;
    }

    auto context = std::make_unique<grpc::ClientContext>();
    PrepareContext(context.get());

    LOG(INFO) << "[gRPC] --> " << shape.rpc_method << " (server stream)";
    VLOG(1) << "[gRPC] --> Content:\n" << input.DebugString();

    return std::unique_ptr<OutputStream>(std::make_unique<GrpcOutputStream>(
        channel_, std::move(context), shape.rpc_method, request, shape.output_type));
}

}  // namespace tether
