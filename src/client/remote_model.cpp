#include "tether/client/remote_model.h"

#include <utility>

#include <absl/strings/str_cat.h>

#include "tether/common/error.h"

namespace tether {

namespace {

const char* CallShapeName(CallShape shape) {
    switch (shape) {
    case CallShape::kUnary:
        return "unary";
    case CallShape::kStreamIn:
        return "stream-in";
    case CallShape::kStreamOut:
        return "stream-out";
    }
    return "unknown";
}

bool SameType(const google::protobuf::Descriptor* a, const google::protobuf::Descriptor* b) {
    return a == b || (a && b && a->full_name() == b->full_name());
}

/// Passes inputs through while checking each against the operation's input
/// type. A mismatch ends the sequence with a configuration error.
class CheckedInputStream final : public InputStream {
public:
    CheckedInputStream(InputStream& inner, const google::protobuf::Descriptor* type,
                       const std::string& method)
        : inner_(inner), type_(type), method_(method) {}

    const google::protobuf::Message* Next() override {
        if (!status_.ok()) {
            return nullptr;
        }
        const google::protobuf::Message* item = inner_.Next();
        if (!item) {
            status_ = inner_.GetStatus();
            return nullptr;
        }
        if (!SameType(item->GetDescriptor(), type_)) {
            status_ = ConfigurationError(absl::StrCat(
                method_, ": input ", index_, " is ", item->GetTypeName(),
                ", expected ", type_->full_name()));
            return nullptr;
        }
        ++index_;
        return item;
    }

    absl::Status GetStatus() const override {
        return status_;
    }

private:
    InputStream& inner_;
    const google::protobuf::Descriptor* type_;
    const std::string& method_;
    absl::Status status_;
    size_t index_ = 0;
};

}  // namespace

RemoteMethod::RemoteMethod(std::string name, OperationShape shape, IProtocolClient* client)
    : name_(std::move(name)),
      shape_(std::move(shape)),
      client_(client) {}

const std::string& RemoteMethod::GetName() const {
    return name_;
}

const OperationShape& RemoteMethod::GetShape() const {
    return shape_;
}

absl::Status RemoteMethod::CheckShape(CallShape expected) const {
    if (shape_.GetCallShape() != expected) {
        return ConfigurationError(absl::StrCat(
            name_, " is a ", CallShapeName(shape_.GetCallShape()),
            " operation, called as ", CallShapeName(expected)));
    }
    return absl::OkStatus();
}

absl::Status RemoteMethod::CheckInputType(const google::protobuf::Message& input) const {
    if (!SameType(input.GetDescriptor(), shape_.input_type)) {
        return ConfigurationError(absl::StrCat(
            name_, ": input is ", input.GetTypeName(), ", expected ",
            shape_.input_type->full_name()));
    }
    return absl::OkStatus();
}

absl::StatusOr<std::unique_ptr<google::protobuf::Message>> RemoteMethod::Run(
    const google::protobuf::Message& input) const {
    auto status = CheckShape(CallShape::kUnary);
    if (status.ok()) {
        status = CheckInputType(input);
    }
    if (!status.ok()) {
        return status;
    }
    return client_->CallUnary(shape_, input);
}

absl::StatusOr<std::unique_ptr<google::protobuf::Message>> RemoteMethod::RunStreamIn(
    InputStream& inputs) const {
    auto status = CheckShape(CallShape::kStreamIn);
    if (!status.ok()) {
        return status;
    }
    CheckedInputStream checked(inputs, shape_.input_type, name_);
    return client_->CallStreamIn(shape_, checked);
}

absl::StatusOr<std::unique_ptr<OutputStream>> RemoteMethod::RunStreamOut(
    const google::protobuf::Message& input) const {
    auto status = CheckShape(CallShape::kStreamOut);
    if (status.ok()) {
        status = CheckInputType(input);
    }
    if (!status.ok()) {
        return status;
    }
    return client_->CallStreamOut(shape_, input);
}

absl::StatusOr<CallOutput> RemoteMethod::operator()(const CallInput& input) const {
    const bool many = std::holds_alternative<InputStream*>(input);
    if (many != (shape_.input_arity == Arity::kMany)) {
        return ConfigurationError(absl::StrCat(
            name_, " takes ", shape_.input_arity == Arity::kMany ? "a sequence" : "one message",
            " as input"));
    }

    if (many) {
        InputStream* inputs = std::get<InputStream*>(input);
        if (!inputs) {
            return ConfigurationError(absl::StrCat(name_, ": null input sequence"));
        }
        auto output = RunStreamIn(*inputs);
        if (!output.ok()) {
            return output.status();
        }
        return CallOutput(std::move(*output));
    }

    const google::protobuf::Message* message = std::get<const google::protobuf::Message*>(input);
    if (!message) {
        return ConfigurationError(absl::StrCat(name_, ": null input message"));
    }
    if (shape_.output_arity == Arity::kMany) {
        auto stream = RunStreamOut(*message);
        if (!stream.ok()) {
            return stream.status();
        }
        return CallOutput(std::move(*stream));
    }
    auto output = Run(*message);
    if (!output.ok()) {
        return output.status();
    }
    return CallOutput(std::move(*output));
}

RemoteModel::RemoteModel(TargetSignature signature,
                         ConnectionDescriptor connection,
                         ResolvedCredentials credentials,
                         std::unique_ptr<IProtocolClient> client)
    : signature_(std::move(signature)),
      connection_(std::move(connection)),
      credentials_(std::move(credentials)),
      client_(std::move(client)) {
    for (const auto& [name, shape] : signature_.GetOperations()) {
        methods_.emplace(name, RemoteMethod(name, shape, client_.get()));
    }
}

const TargetSignature& RemoteModel::GetSignature() const {
    return signature_;
}

const ConnectionDescriptor& RemoteModel::GetConnection() const {
    return connection_;
}

Protocol RemoteModel::GetProtocol() const {
    return client_->GetProtocol();
}

bool RemoteModel::IsSecure() const {
    return credentials_.tls;
}

std::vector<std::string> RemoteModel::ListMethods() const {
    std::vector<std::string> names;
    names.reserve(methods_.size());
    for (const auto& entry : methods_) {
        names.push_back(entry.first);
    }
    return names;
}

absl::StatusOr<const RemoteMethod*> RemoteModel::GetMethod(const std::string& name) const {
    auto it = methods_.find(name);
    if (it == methods_.end()) {
        return WithErrorKind(
            absl::NotFoundError(absl::StrCat(signature_.GetTargetId(),
                                             " has no operation '", name, "'")),
            ErrorKind::kConfiguration);
    }
    return &it->second;
}

absl::StatusOr<std::unique_ptr<google::protobuf::Message>> RemoteModel::Run(
    const std::string& name,
    const google::protobuf::Message& input) const {
    auto method = GetMethod(name);
    if (!method.ok()) {
        return method.status();
    }
    return (*method)->Run(input);
}

absl::StatusOr<std::unique_ptr<google::protobuf::Message>> RemoteModel::RunStreamIn(
    const std::string& name,
    InputStream& inputs) const {
    auto method = GetMethod(name);
    if (!method.ok()) {
        return method.status();
    }
    return (*method)->RunStreamIn(inputs);
}

absl::StatusOr<std::unique_ptr<OutputStream>> RemoteModel::RunStreamOut(
    const std::string& name,
    const google::protobuf::Message& input) const {
    auto method = GetMethod(name);
    if (!method.ok()) {
        return method.status();
    }
    return (*method)->RunStreamOut(input);
}

absl::StatusOr<CallOutput> RemoteModel::Invoke(const std::string& name,
                                               const CallInput& input) const {
    auto method = GetMethod(name);
    if (!method.ok()) {
        return method.status();
    }
    return (**method)(input);
}

}  // namespace tether
