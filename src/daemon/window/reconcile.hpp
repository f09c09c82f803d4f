#pragma once

#include "platform/window_source.hpp"
#include "window/window_error.hpp"
#include "window/window_record.hpp"

#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <vector>

struct ReconcileOptions {
    // An entry is dropped only when BOTH axes are below the minimum.
    int min_width = 50;
    int min_height = 50;
    std::vector<std::string> denylist;
    std::chrono::milliseconds process_query_timeout{250};
    int self_pid = 0; // never listed; 0 disables the check
};

using LogFn = std::function<void(const std::string&)>;

// Merge the window-server listing with each process's own window list into
// one deduplicated list, grouped by owner pid in first-seen order.
// Fails only when the window-server listing itself is unavailable.
std::expected<std::vector<WindowRecord>, WindowError>
reconcile(WindowSource& source, const ReconcileOptions& options, const LogFn& log = {});

// Why a window-server entry is discarded before grouping, or nullopt to keep it.
std::optional<std::string> exclusion_reason(const ServerWindow& window,
                                            const ReconcileOptions& options);

// "<owner> - Window <ordinal>", ordinal is 1-based.
std::string fallback_title(const std::string& owner_name, size_t ordinal);
