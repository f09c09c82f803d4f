#pragma once

#include "platform/window_source.hpp"
#include "window/reconcile.hpp"
#include "window/window_error.hpp"
#include "window/window_record.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Foregrounds the owning process, then raises the window. The order matters:
// raising a window of a background process is unreliable. Handles without a
// window id stop after the first step.
std::expected<void, WindowError> activate_window(const WindowRecord& record, WindowSource& source);

// Holds one search session: the last reconciled list and the last search
// results. refresh() may run on a worker thread while the other members are
// called from the event loop; the list is only ever replaced whole.
class WindowEngine {
public:
    using Snapshot = std::shared_ptr<const std::vector<WindowRecord>>;
    using Clock = std::chrono::system_clock;

    WindowEngine(WindowSource& source, ReconcileOptions options, LogFn log = {});

    WindowEngine(const WindowEngine&) = delete;
    WindowEngine& operator=(const WindowEngine&) = delete;

    // Rebuilds the list from scratch and publishes it. On failure an empty
    // list is published. A close() while running discards the result.
    std::expected<Snapshot, WindowError> refresh();

    // Never null.
    Snapshot snapshot() const;
    bool has_snapshot() const;

    // Filters the current snapshot and remembers the result for result_at().
    std::vector<WindowRecord> search(std::string_view query);

    std::optional<WindowRecord> find(const std::string& identity) const;
    std::optional<WindowRecord> result_at(size_t index) const;

    std::expected<void, WindowError> activate(const WindowRecord& record);

    // Ends the session: drops the list and the last results.
    void close();

    std::optional<Clock::time_point> last_refresh() const;

private:
    void publish(Snapshot list, uint64_t generation);

    WindowSource& source_;
    ReconcileOptions options_;
    LogFn log_;

    mutable std::mutex mutex_;
    Snapshot records_;
    bool has_snapshot_ = false;
    std::vector<WindowRecord> last_results_;
    std::optional<Clock::time_point> last_refresh_;
    uint64_t generation_ = 0;
};
