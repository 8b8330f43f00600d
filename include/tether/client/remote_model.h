#pragma once

#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <google/protobuf/message.h>

#include "tether/client/connection.h"
#include "tether/client/protocol_client.h"
#include "tether/client/security.h"
#include "tether/client/signature.h"
#include "tether/client/streams.h"

namespace tether {

// Arity-generic call argument and result: a single message or a sequence.
using CallInput = std::variant<const google::protobuf::Message*, InputStream*>;
using CallOutput = std::variant<std::unique_ptr<google::protobuf::Message>,
                                std::unique_ptr<OutputStream>>;

/// One operation of a remote target, bound to the proxy's protocol client.
/// Inputs are checked against the operation shape before anything is sent.
class RemoteMethod {
public:
    RemoteMethod(std::string name, OperationShape shape, IProtocolClient* client);

    const std::string& GetName() const;
    const OperationShape& GetShape() const;

    absl::StatusOr<std::unique_ptr<google::protobuf::Message>> Run(
        const google::protobuf::Message& input) const;

    absl::StatusOr<std::unique_ptr<google::protobuf::Message>> RunStreamIn(
        InputStream& inputs) const;

    absl::StatusOr<std::unique_ptr<OutputStream>> RunStreamOut(
        const google::protobuf::Message& input) const;

    // Dispatch by the operation's call shape.
    absl::StatusOr<CallOutput> operator()(const CallInput& input) const;

private:
    absl::Status CheckShape(CallShape expected) const;
    absl::Status CheckInputType(const google::protobuf::Message& input) const;

    std::string name_;
    OperationShape shape_;
    IProtocolClient* client_;
};

/// Local stand-in for a model served remotely. Exposes exactly the
/// operations of its signature; each forwards to the protocol client.
/// Owns its transport; destroying the proxy releases it.
class RemoteModel {
public:
    RemoteModel(TargetSignature signature,
                ConnectionDescriptor connection,
                ResolvedCredentials credentials,
                std::unique_ptr<IProtocolClient> client);

    RemoteModel(const RemoteModel&) = delete;
    RemoteModel& operator=(const RemoteModel&) = delete;

    const TargetSignature& GetSignature() const;
    const ConnectionDescriptor& GetConnection() const;
    Protocol GetProtocol() const;
    bool IsSecure() const;

    std::vector<std::string> ListMethods() const;

    // Unknown names yield NotFound.
    absl::StatusOr<const RemoteMethod*> GetMethod(const std::string& name) const;

    absl::StatusOr<std::unique_ptr<google::protobuf::Message>> Run(
        const std::string& name,
        const google::protobuf::Message& input) const;

    absl::StatusOr<std::unique_ptr<google::protobuf::Message>> RunStreamIn(
        const std::string& name,
        InputStream& inputs) const;

    absl::StatusOr<std::unique_ptr<OutputStream>> RunStreamOut(
        const std::string& name,
        const google::protobuf::Message& input) const;

    absl::StatusOr<CallOutput> Invoke(const std::string& name, const CallInput& input) const;

private:
    TargetSignature signature_;
    ConnectionDescriptor connection_;
    ResolvedCredentials credentials_;
    std::unique_ptr<IProtocolClient> client_;
    std::map<std::string, RemoteMethod> methods_;
};

// Convenience downcast of a call result to its generated type. Returns
// nullptr when the message is of another type.
template <typename MessageT>
std::unique_ptr<MessageT> MessageAs(std::unique_ptr<google::protobuf::Message> message) {
    if (!message || message->GetDescriptor() != MessageT::descriptor()) {
        return nullptr;
    }
    return std::unique_ptr<MessageT>(static_cast<MessageT*>(message.release()));
}

}  // namespace tether
