#pragma once

#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace Reqflow {

/**
 * Error taxonomy of capability calls and workflow runs, expressed as
 * absl::Status codes so collaborators can classify their own failures.
 *
 * Retryable: Unavailable, DeadlineExceeded, ResourceExhausted, Aborted.
 * Everything else except Cancelled is fatal for the item it happened on.
 */

// Network, timeout or rate-limit failure; the worker pool retries it.
inline absl::Status TransientCallError(absl::string_view message) {
    return absl::UnavailableError(message);
}

// Malformed input or a collaborator bug; retried never.
inline absl::Status FatalCallError(absl::string_view message) {
    return absl::InvalidArgumentError(message);
}

inline absl::Status CancelledError(absl::string_view message = "workflow cancelled") {
    return absl::CancelledError(message);
}

// Every item of a phase errored.
inline absl::Status PhaseExhaustedError(absl::string_view message) {
    return absl::FailedPreconditionError(message);
}

inline absl::Status DuplicateRunError(absl::string_view correlation_id) {
    return absl::AlreadyExistsError(correlation_id);
}

inline bool IsRetryable(const absl::Status& status) {
    switch (status.code()) {
        case absl::StatusCode::kUnavailable:
        case absl::StatusCode::kDeadlineExceeded:
        case absl::StatusCode::kResourceExhausted:
        case absl::StatusCode::kAborted:
            return true;
        default:
            return false;
    }
}

inline bool IsCancellation(const absl::Status& status) {
    return status.code() == absl::StatusCode::kCancelled;
}

} // namespace Reqflow
