#pragma once

#include "window/window_error.hpp"
#include "window/window_record.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

// One entry of the flat, system-wide window listing.
struct ServerWindow {
    int owner_pid = 0;            // 0 when the owner could not be resolved
    int layer = 0;                // 0 = ordinary application window
    std::string title;
    bool on_screen = false;
    std::optional<double> alpha;  // absent when the source has no opacity data
    int width = 0;
    int height = 0;
    int64_t window_number = 0;
};

// One window as seen through the owning process's own window tree.
struct ProcessWindow {
    std::string title;
    bool minimized = false;
    ActivationHandle activation;
};

struct ProcessInfo {
    std::string display_name;
    std::optional<std::string> icon;
    std::string identifier; // matched against the denylist
};

class WindowSource {
public:
    virtual ~WindowSource() = default;

    virtual std::expected<std::vector<ServerWindow>, WindowError> list_server_windows() = 0;

    // Empty list when the process exposes no windows. Fails with
    // AccessibilityTimeout when the process does not answer within `timeout`.
    virtual std::expected<std::vector<ProcessWindow>, WindowError>
        list_process_windows(int pid, std::chrono::milliseconds timeout) = 0;

    virtual std::optional<ProcessInfo> resolve_process(int pid) = 0;

    virtual std::expected<void, WindowError> activate_process(const ActivationHandle& handle) = 0;
    virtual std::expected<void, WindowError> focus_window(const ActivationHandle& handle) = 0;
};
