#pragma once

#include <map>
#include <memory>
#include <string>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <google/protobuf/descriptor.h>
#include <google/protobuf/message.h>

#include "tether/client/connection.h"

namespace tether {

enum class Arity {
    kOne,
    kMany
};

enum class CallShape {
    kUnary,      // ONE -> ONE
    kStreamIn,   // MANY -> ONE
    kStreamOut   // ONE -> MANY
};

struct OperationShape {
    Arity input_arity = Arity::kOne;
    Arity output_arity = Arity::kOne;
    const google::protobuf::Descriptor* input_type = nullptr;
    const google::protobuf::Descriptor* output_type = nullptr;

    // Transport routes. Filled with defaults by TargetSignature::AddOperation
    // when left empty.
    std::string rpc_method;  // "/package.Service/Method"
    std::string http_route;  // "/api/v1/<target_id>/<operation>"

    CallShape GetCallShape() const;
};

/// Operations a remote target exposes, fixed at construction.
class TargetSignature {
public:
    TargetSignature(std::string target_id, std::string service_name);

    // Derive one operation per method of |service|. Client-streaming methods
    // take MANY inputs, server-streaming methods produce MANY outputs.
    static absl::StatusOr<TargetSignature> FromService(
        const google::protobuf::ServiceDescriptor* service,
        std::string target_id);

    // Rejects duplicate names, missing types and bidirectional shapes.
    absl::Status AddOperation(const std::string& name, OperationShape shape);

    const std::string& GetTargetId() const;
    const std::string& GetServiceName() const;
    const std::map<std::string, OperationShape>& GetOperations() const;
    const OperationShape* FindOperation(const std::string& name) const;

    // Checks the signature is usable over |protocol|.
    absl::Status Validate(Protocol protocol) const;

private:
    std::string target_id_;
    std::string service_name_;
    std::map<std::string, OperationShape> operations_;
};

// New empty message of |type|. Generated types produce their generated
// class, other descriptors a dynamic message. Returns nullptr for null.
std::unique_ptr<google::protobuf::Message> NewMessage(const google::protobuf::Descriptor* type);

}  // namespace tether
