#include "tether/client/signature.h"

#include <utility>

#include <absl/strings/str_cat.h>
#include <google/protobuf/dynamic_message.h>

#include "tether/common/error.h"

namespace tether {

namespace {

google::protobuf::DynamicMessageFactory& SharedMessageFactory() {
    static auto* factory = [] {
        auto* f = new google::protobuf::DynamicMessageFactory();
        f->SetDelegateToGeneratedFactory(true);
        return f;
    }();
    return *factory;
}

}  // namespace

CallShape OperationShape::GetCallShape() const {
    if (input_arity == Arity::kMany) {
        return CallShape::kStreamIn;
    }
    if (output_arity == Arity::kMany) {
        return CallShape::kStreamOut;
    }
    return CallShape::kUnary;
}

TargetSignature::TargetSignature(std::string target_id, std::string service_name)
    : target_id_(std::move(target_id)),
      service_name_(std::move(service_name)) {
}

absl::StatusOr<TargetSignature> TargetSignature::FromService(
    const google::protobuf::ServiceDescriptor* service,
    std::string target_id) {
    if (service == nullptr) {
        return ConfigurationError("service descriptor is null");
    }

    TargetSignature signature(std::move(target_id), service->full_name());
    for (int i = 0; i < service->method_count(); ++i) {
        const auto* method = service->method(i);
        OperationShape shape;
        shape.input_arity = method->client_streaming() ? Arity::kMany : Arity::kOne;
        shape.output_arity = method->server_streaming() ? Arity::kMany : Arity::kOne;
        shape.input_type = method->input_type();
        shape.output_type = method->output_type();

        auto status = signature.AddOperation(method->name(), std::move(shape));
        if (!status.ok()) {
            return status;
        }
    }
    return signature;
}

absl::Status TargetSignature::AddOperation(const std::string& name, OperationShape shape) {
    if (name.empty()) {
        return ConfigurationError("operation name must not be empty");
    }
    if (operations_.count(name) != 0) {
        return ConfigurationError(absl::StrCat("operation '", name, "' declared twice"));
    }
    if (shape.input_type == nullptr || shape.output_type == nullptr) {
        return ConfigurationError(
            absl::StrCat("operation '", name, "' must declare input and output types"));
    }
    if (shape.input_arity == Arity::kMany && shape.output_arity == Arity::kMany) {
        return ConfigurationError(
            absl::StrCat("operation '", name, "' is bidirectional streaming, which is not supported"));
    }

    if (shape.rpc_method.empty() && !service_name_.empty()) {
        shape.rpc_method = absl::StrCat("/", service_name_, "/", name);
    }
    if (shape.http_route.empty()) {
        shape.http_route = absl::StrCat("/api/v1/", target_id_, "/", name);
    }

    operations_.emplace(name, std::move(shape));
    return absl::OkStatus();
}

const std::string& TargetSignature::GetTargetId() const {
    return target_id_;
}

const std::string& TargetSignature::GetServiceName() const {
    return service_name_;
}

const std::map<std::string, OperationShape>& TargetSignature::GetOperations() const {
    return operations_;
}

const OperationShape* TargetSignature::FindOperation(const std::string& name) const {
    auto it = operations_.find(name);
    if (it == operations_.end()) {
        return nullptr;
    }
    return &it->second;
}

absl::Status TargetSignature::Validate(Protocol protocol) const {
    if (target_id_.empty()) {
        return ConfigurationError("target id must not be empty");
    }
    if (operations_.empty()) {
        return ConfigurationError(absl::StrCat("target '", target_id_, "' declares no operations"));
    }
    for (const auto& [name, shape] : operations_) {
        if (protocol == Protocol::kGrpc && shape.rpc_method.empty()) {
            return ConfigurationError(
                absl::StrCat("operation '", name, "' has no gRPC method: set a service name"));
        }
        if (protocol == Protocol::kHttp && shape.http_route.empty()) {
            return ConfigurationError(absl::StrCat("operation '", name, "' has no HTTP route"));
        }
    }
    return absl::OkStatus();
}

std::unique_ptr<google::protobuf::Message> NewMessage(const google::protobuf::Descriptor* type) {
    if (type == nullptr) {
        return nullptr;
    }
    const google::protobuf::Message* prototype = SharedMessageFactory().GetPrototype(type);
    if (prototype == nullptr) {
        return nullptr;
    }
    return std::unique_ptr<google::protobuf::Message>(prototype->New());
}

}  // namespace tether
