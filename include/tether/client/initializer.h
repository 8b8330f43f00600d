#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include <absl/status/statusor.h>

#include "tether/client/connection.h"
#include "tether/client/remote_model.h"
#include "tether/client/signature.h"

namespace tether {

struct InitializerConfig {
    // Used when the connection descriptor carries no timeout of its own.
    std::optional<std::chrono::milliseconds> default_timeout;
    size_t max_batch_bytes = 16 * 1024 * 1024;   // HTTP stream-in batch bound
    size_t max_message_size = 16 * 1024 * 1024;  // gRPC send/receive limit
    std::string user_agent = "tether-client";
};

/// Builds RemoteModel proxies. Init() validates everything up front and
/// never touches the network; the first call on the proxy is the first I/O.
class RemoteModelInitializer {
public:
    explicit RemoteModelInitializer(InitializerConfig config = {},
                                    std::string instance_name = "default");

    absl::StatusOr<std::unique_ptr<RemoteModel>> Init(
        const TargetSignature& signature,
        const ConnectionDescriptor& connection) const;

    const InitializerConfig& GetConfig() const;
    const std::string& GetInstanceName() const;

private:
    InitializerConfig config_;
    std::string instance_name_;
};

}  // namespace tether
