#include "tether/common/error.h"

#include <absl/strings/cord.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>

#include <utility>

namespace tether {

namespace {

constexpr char kKindUrl[] = "type.tether.dev/tether.ErrorKind";
constexpr char kDeliveredUrl[] = "type.tether.dev/tether.DeliveredCount";
constexpr char kHttpStatusUrl[] = "type.tether.dev/tether.HttpStatus";
constexpr char kRemotePayloadUrl[] = "type.tether.dev/tether.RemotePayload";

std::optional<long long> GetIntPayload(const absl::Status& status, absl::string_view url) {
    auto payload = status.GetPayload(url);
    if (!payload.has_value()) {
        return std::nullopt;
    }
    long long value = 0;
    if (!absl::SimpleAtoi(std::string(*payload), &value)) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::kNone: return "NONE";
    case ErrorKind::kConfiguration: return "CONFIGURATION";
    case ErrorKind::kConnection: return "CONNECTION";
    case ErrorKind::kRemote: return "REMOTE";
    case ErrorKind::kTimeout: return "TIMEOUT";
    case ErrorKind::kStream: return "STREAM";
    }
    return "UNKNOWN";
}

absl::Status WithErrorKind(absl::Status status, ErrorKind kind) {
    if (status.ok()) {
        return status;
    }
    status.SetPayload(kKindUrl, absl::Cord(absl::StrCat(static_cast<int>(kind))));
    return status;
}

absl::Status ConfigurationError(absl::string_view message) {
    return WithErrorKind(absl::InvalidArgumentError(message), ErrorKind::kConfiguration);
}

absl::Status ConnectionError(absl::string_view message) {
    return WithErrorKind(absl::UnavailableError(message), ErrorKind::kConnection);
}

absl::Status TimeoutError(absl::string_view message) {
    return WithErrorKind(absl::DeadlineExceededError(message), ErrorKind::kTimeout);
}

absl::Status RemoteError(absl::StatusCode code, absl::string_view message) {
    if (code == absl::StatusCode::kOk) {
        code = absl::StatusCode::kUnknown;
    }
    return WithErrorKind(absl::Status(code, message), ErrorKind::kRemote);
}

absl::Status HttpRemoteError(int http_status, absl::string_view message,
                             const std::string& body) {
    absl::Status status = RemoteError(
        HttpStatusToCode(http_status),
        absl::StrCat("HTTP ", http_status, ": ", message));
    status.SetPayload(kHttpStatusUrl, absl::Cord(absl::StrCat(http_status)));
    if (!body.empty()) {
        status.SetPayload(kRemotePayloadUrl, absl::Cord(body));
    }
    return status;
}

absl::Status StreamError(const absl::Status& cause, size_t delivered) {
    absl::Status status(cause.code(),
                        absl::StrCat("stream failed after ", delivered,
                                     " message(s): ", cause.message()));
    // Keep the remote details of the underlying failure.
    cause.ForEachPayload([&status](absl::string_view url, const absl::Cord& payload) {
        status.SetPayload(url, payload);
    });
    status.SetPayload(kDeliveredUrl, absl::Cord(absl::StrCat(delivered)));
    return WithErrorKind(std::move(status), ErrorKind::kStream);
}

ErrorKind GetErrorKind(const absl::Status& status) {
    if (status.ok()) {
        return ErrorKind::kNone;
    }
    auto value = GetIntPayload(status, kKindUrl);
    if (!value.has_value() || *value < 0 ||
        *value > static_cast<int>(ErrorKind::kStream)) {
        return ErrorKind::kNone;
    }
    return static_cast<ErrorKind>(*value);
}

std::optional<size_t> GetDeliveredCount(const absl::Status& status) {
    auto value = GetIntPayload(status, kDeliveredUrl);
    if (!value.has_value() || *value < 0) {
        return std::nullopt;
    }
    return static_cast<size_t>(*value);
}

std::optional<int> GetHttpStatus(const absl::Status& status) {
    auto value = GetIntPayload(status, kHttpStatusUrl);
    if (!value.has_value()) {
        return std::nullopt;
    }
    return static_cast<int>(*value);
}

std::optional<std::string> GetRemotePayload(const absl::Status& status) {
    auto payload = status.GetPayload(kRemotePayloadUrl);
    if (!payload.has_value()) {
        return std::nullopt;
    }
    return std::string(*payload);
}

absl::StatusCode HttpStatusToCode(int http_status) {
    switch (http_status) {
    case 400: return absl::StatusCode::kInvalidArgument;
    case 401: return absl::StatusCode::kUnauthenticated;
    case 403: return absl::StatusCode::kPermissionDenied;
    case 404: return absl::StatusCode::kNotFound;
    case 409: return absl::StatusCode::kAborted;
    case 429: return absl::StatusCode::kResourceExhausted;
    case 499: return absl::StatusCode::kCancelled;
    case 501: return absl::StatusCode::kUnimplemented;
    case 503: return absl::StatusCode::kUnavailable;
    case 504: return absl::StatusCode::kDeadlineExceeded;
    default:
        break;
    }
    if (http_status >= 400 && http_status < 500) {
        return absl::StatusCode::kFailedPrecondition;
    }
    if (http_status >= 500 && http_status < 600) {
        return absl::StatusCode::kInternal;
    }
    return absl::StatusCode::kUnknown;
}

}  // namespace tether
