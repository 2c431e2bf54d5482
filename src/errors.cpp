#include "taskgate/errors.hpp"

namespace taskgate {

const char* to_string(FailureKind kind) {
    switch (kind) {
    case FailureKind::None: return "none";
    case FailureKind::ClassificationBlocked: return "classification_blocked";
    case FailureKind::ApprovalDenied: return "approval_denied";
    case FailureKind::ApprovalTimedOut: return "approval_timed_out";
    case FailureKind::ExecutorFailure: return "executor_failure";
    case FailureKind::DependencyStalled: return "dependency_stalled";
    case FailureKind::Cancelled: return "cancelled";
    case FailureKind::DuplicateResolution: return "duplicate_resolution";
    }
    return "unknown";
}

const char* reason_tag(FailureKind kind) {
    switch (kind) {
    case FailureKind::None: return "";
    case FailureKind::ClassificationBlocked: return "blocked";
    case FailureKind::ApprovalDenied: return "denied";
    case FailureKind::ApprovalTimedOut: return "timeout";
    case FailureKind::ExecutorFailure: return "executor failure";
    case FailureKind::DependencyStalled: return "dependency stalled";
    case FailureKind::Cancelled: return "cancelled";
    case FailureKind::DuplicateResolution: return "already resolved";
    }
    return "unknown";
}

} // namespace taskgate
