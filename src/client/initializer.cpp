#include "tether/client/initializer.h"

#include <utility>

#include <absl/log/log.h>

#include "tether/client/protocol_client.h"
#include "tether/client/security.h"
#include "tether/common/error.h"

namespace tether {

RemoteModelInitializer::RemoteModelInitializer(InitializerConfig config,
                                               std::string instance_name)
    : config_(std::move(config)),
      instance_name_(std::move(instance_name)) {}

const InitializerConfig& RemoteModelInitializer::GetConfig() const {
    return config_;
}

const std::string& RemoteModelInitializer::GetInstanceName() const {
    return instance_name_;
}

absl::StatusOr<std::unique_ptr<RemoteModel>> RemoteModelInitializer::Init(
    const TargetSignature& signature,
    const ConnectionDescriptor& connection) const {

    auto status = signature.Validate(connection.GetProtocol());
    if (!status.ok()) {
        LOG(WARNING) << "[" << instance_name_ << "] Rejected signature for "
                     << signature.GetTargetId() << ": " << status.message();
        return status;
    }

    auto credentials = ResolveTransportSecurity(connection.GetTls(), connection.GetProtocol());
    if (!credentials.ok()) {
        LOG(WARNING) << "[" << instance_name_ << "] Rejected security settings for "
                     << connection.GetTarget() << ": " << credentials.status().message();
        return credentials.status();
    }

    ClientOptions options;
    options.target_id = signature.GetTargetId();
    options.timeout = connection.GetTimeout() ? connection.GetTimeout() : config_.default_timeout;
    options.max_message_size = config_.max_message_size;
    options.max_batch_bytes = config_.max_batch_bytes;
    options.user_agent = config_.user_agent;

    auto client = CreateProtocolClient(connection, *credentials, options);
    if (!client.ok()) {
        return client.status();
    }

    LOG(INFO) << "[" << instance_name_ << "] Remote model " << signature.GetTargetId()
              << " at " << connection.GetTarget() << " over "
              << ProtocolName(connection.GetProtocol()) << " with "
              << signature.GetOperations().size() << " operation(s)";

    return std::make_unique<RemoteModel>(signature, connection, std::move(*credentials),
                                         std::move(*client));
}

}  // namespace tether
