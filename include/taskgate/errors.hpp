#pragma once
#include <string>

namespace taskgate {

// Why a task or request ended up where it did. Only ExecutorFailure is retried.
enum class FailureKind {
    None,
    ClassificationBlocked,
    ApprovalDenied,
    ApprovalTimedOut,
    ExecutorFailure,
    DependencyStalled,
    Cancelled,
    DuplicateResolution
};

const char* to_string(FailureKind kind);

// Short reason tag persisted on the task ("blocked", "denied", "timeout", ...).
const char* reason_tag(FailureKind kind);

inline bool is_retryable(FailureKind kind) { return kind == FailureKind::ExecutorFailure; }

} // namespace taskgate
