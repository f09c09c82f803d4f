#pragma once

#include "window/reconcile.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

struct Config {
    static constexpr int64_t MAX_PROCESS_QUERY_TIMEOUT_MS = 10000;

    struct Source {
        std::string type = "sway";
        uint32_t process_query_timeout_ms = 250;
    } source;

    struct Filter {
        int min_width = 50;
        int min_height = 50;
        // Matched against the process identifier (executable name).
        std::vector<std::string> denylist = {
            "swaylock", "gdm-session-worker", "tracker-miner-fs-3", "window-search",
        };
    } filter;

    // Derived for the reconciler; self_pid is filled in by the caller.
    ReconcileOptions reconcile_options() const {
        return ReconcileOptions{
            .min_width = filter.min_width,
            .min_height = filter.min_height,
            .denylist = filter.denylist,
            .process_query_timeout = std::chrono::milliseconds(source.process_query_timeout_ms),
        };
    }

    static Config load(const std::string& path);
    static Config load_default();
};
