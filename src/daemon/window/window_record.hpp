#pragma once

#include <cstdint>
#include <optional>
#include <string>

// Interpreted only by the WindowSource that produced it.
struct ActivationHandle {
    int pid = 0;
    std::optional<int64_t> window_id; // absent: process-level activation only

    bool has_window() const { return window_id.has_value(); }
};

struct WindowRecord {
    std::string identity;                  // unique within one refreshed list
    std::string title;                     // never empty once reconciled
    std::string owner_name;                // e.g. "Firefox"
    std::optional<std::string> owner_icon; // freedesktop icon name
    ActivationHandle activation;
    int owner_pid = 0;
    bool synthesized = false;              // window-server entry with no per-process match
};
