#pragma once

#include <string>
#include <string_view>

enum class WindowErrorKind {
    PermissionDenied,
    SourceUnavailable,
    ProcessUnresolvable,
    AccessibilityTimeout,
    ActivationFailed,
};

struct WindowError {
    WindowErrorKind kind;
    std::string message;
};

constexpr std::string_view to_string(WindowErrorKind kind) {
    switch (kind) {
        case WindowErrorKind::PermissionDenied: return "permission_denied";
        case WindowErrorKind::SourceUnavailable: return "source_unavailable";
        case WindowErrorKind::ProcessUnresolvable: return "process_unresolvable";
        case WindowErrorKind::AccessibilityTimeout: return "accessibility_timeout";
        case WindowErrorKind::ActivationFailed: return "activation_failed";
    }
    return "unknown";
}
