#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <absl/status/status.h>
#include <absl/strings/string_view.h>

namespace tether {

/* Every status returned by the remote call layer carries one of these kinds */
/* as a payload, so callers can tell "never connected" from "failed remotely". */
enum class ErrorKind {
    kNone,
    kConfiguration,  // Rejected before any network I/O
    kConnection,     // Endpoint unreachable or TLS handshake failure
    kRemote,         // Server returned an application-level failure
    kTimeout,        // Per-call deadline expired
    kStream          // Failure after partial delivery of a stream
};

const char* ErrorKindName(ErrorKind kind);

// Attach |kind| to an existing non-OK status.
absl::Status WithErrorKind(absl::Status status, ErrorKind kind);

absl::Status ConfigurationError(absl::string_view message);
absl::Status ConnectionError(absl::string_view message);
absl::Status TimeoutError(absl::string_view message);

// Remote failure reported by a gRPC server. |code| is the gRPC status code
// (numerically identical to absl::StatusCode).
absl::Status RemoteError(absl::StatusCode code, absl::string_view message);

// Remote failure reported by an HTTP server with a status outside 2xx.
// |body| is kept verbatim as the remote payload.
absl::Status HttpRemoteError(int http_status, absl::string_view message,
                             const std::string& body);

// Wrap |cause| after |delivered| units of a stream reached the caller.
absl::Status StreamError(const absl::Status& cause, size_t delivered);

// Returns kNone for OK statuses and for statuses produced outside this layer.
ErrorKind GetErrorKind(const absl::Status& status);

std::optional<size_t> GetDeliveredCount(const absl::Status& status);
std::optional<int> GetHttpStatus(const absl::Status& status);
std::optional<std::string> GetRemotePayload(const absl::Status& status);

absl::StatusCode HttpStatusToCode(int http_status);

}  // namespace tether
