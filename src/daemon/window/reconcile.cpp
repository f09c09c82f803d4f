#include "window/reconcile.hpp"

#include <algorithm>
#include <format>
#include <unordered_map>
#include <unordered_set>

namespace {

struct ProcessGroup {
    int pid = 0;
    std::vector<ServerWindow> entries;
};

// Groups keep the order in which their pid was first seen.
std::vector<ProcessGroup> group_by_pid(std::vector<ServerWindow> windows) {
    std::vector<ProcessGroup> groups;
    std::unordered_map<int, size_t> index;

    for (auto& w : windows) {
        auto [it, inserted] = index.try_emplace(w.owner_pid, groups.size());
        if (inserted) groups.push_back({w.owner_pid, {}});
        groups[it->second].entries.push_back(std::move(w));
    }
    return groups;
}

bool is_denied(const ProcessInfo& info, const std::vector<std::string>& denylist) {
    return std::ranges::find(denylist, info.identifier) != denylist.end();
}

class GroupReconciler {
public:
    GroupReconciler(const ProcessGroup& group, const ProcessInfo& info,
                    std::unordered_set<std::string>& seen, std::vector<WindowRecord>& out)
        : group_(group), info_(info), seen_(seen), out_(out),
          matched_(group.entries.size(), false) {}

    void add_process_windows(const std::vector<ProcessWindow>& windows) {
        // Titled windows claim their window-server entries first, so a blank
        // title never borrows a title that belongs to a sibling.
        std::vector<std::string> titles(windows.size());
        for (size_t i = 0; i < windows.size(); i++) {
            if (windows[i].title.empty()) continue;
            titles[i] = windows[i].title;
            claim_by_title(windows[i].title);
        }

        for (size_t i = 0; i < windows.size(); i++) {
            if (!windows[i].title.empty() || windows[i].minimized) continue;
            if (auto entry = claim_untitled()) {
                titles[i] = group_.entries[*entry].title;
            }
        }

        for (size_t i = 0; i < windows.size(); i++) {
            if (windows[i].minimized) continue;

            size_t ordinal = i + 1;
            auto title = titles[i].empty() ? fallback_title(info_.display_name, ordinal) : titles[i];
            auto identity = std::format("{}:ax:{}:{}", group_.pid, ordinal, title);

            emit(std::move(identity), std::move(title), windows[i].activation, false);
        }
    }

    // Window-server entries the process's own tree never reported, e.g.
    // windows on another workspace. Only process-level activation is possible.
    void add_unmatched_entries() {
        for (size_t i = 0; i < group_.entries.size(); i++) {
            if (matched_[i]) continue;
            const auto& entry = group_.entries[i];

            auto title = entry.title.empty() ? fallback_title(info_.display_name, i + 1) : entry.title;
            auto identity = std::format("{}:ws:{}:{}", group_.pid, entry.window_number, title);

            emit(std::move(identity), std::move(title), ActivationHandle{.pid = group_.pid}, true);
        }
    }

private:
    void claim_by_title(const std::string& title) {
        for (size_t i = 0; i < group_.entries.size(); i++) {
            if (!matched_[i] && group_.entries[i].title == title) {
                matched_[i] = true;
                return;
            }
        }
    }

    // Prefers an entry that carries a title; an untitled entry is still
    // claimed so the same window is not synthesized a second time.
    std::optional<size_t> claim_untitled() {
        std::optional<size_t> fallback;
        for (size_t i = 0; i < group_.entries.size(); i++) {
            if (matched_[i]) continue;
            if (!group_.entries[i].title.empty()) {
                matched_[i] = true;
                return i;
            }
            if (!fallback) fallback = i;
        }
        if (fallback) matched_[*fallback] = true;
        return std::nullopt;
    }

    void emit(std::string identity, std::string title, ActivationHandle handle, bool synthesized) {
        if (!seen_.insert(identity).second) return;

        out_.push_back(WindowRecord{
            .identity = std::move(identity),
            .title = std::move(title),
            .owner_name = info_.display_name,
            .owner_icon = info_.icon,
            .activation = std::move(handle),
            .owner_pid = group_.pid,
            .synthesized = synthesized,
        });
    }

    const ProcessGroup& group_;
    const ProcessInfo& info_;
    std::unordered_set<std::string>& seen_;
    std::vector<WindowRecord>& out_;
    std::vector<bool> matched_;
};

} // namespace

std::optional<std::string> exclusion_reason(const ServerWindow& window,
                                            const ReconcileOptions& options) {
    if (window.owner_pid <= 0) return "unresolved owner";
    if (window.layer != 0) return std::format("layer {}", window.layer);
    if (window.alpha && *window.alpha <= 0.0) return "fully transparent";
    if (window.width < options.min_width && window.height < options.min_height) {
        return std::format("too small ({}x{})", window.width, window.height);
    }
    return std::nullopt;
}

std::string fallback_title(const std::string& owner_name, size_t ordinal) {
    return std::format("{} - Window {}", owner_name, ordinal);
}

std::expected<std::vector<WindowRecord>, WindowError>
reconcile(WindowSource& source, const ReconcileOptions& options, const LogFn& log) {
    auto note = [&](const std::string& msg) {
        if (log) log(msg);
    };

    auto listing = source.list_server_windows();
    if (!listing) return std::unexpected(listing.error());

    std::vector<ServerWindow> candidates;
    candidates.reserve(listing->size());
    for (auto& w : *listing) {
        if (auto reason = exclusion_reason(w, options)) {
            note(std::format("skip window {} \"{}\": {}", w.window_number, w.title, *reason));
            continue;
        }
        candidates.push_back(std::move(w));
    }

    std::vector<WindowRecord> records;
    std::unordered_set<std::string> seen;

    for (const auto& group : group_by_pid(std::move(candidates))) {
        if (options.self_pid != 0 && group.pid == options.self_pid) continue;

        auto info = source.resolve_process(group.pid);
        if (!info) {
            note(std::format("skip pid {}: process unresolvable", group.pid));
            continue;
        }
        if (is_denied(*info, options.denylist)) {
            note(std::format("skip pid {}: {} is denylisted", group.pid, info->identifier));
            continue;
        }

        GroupReconciler merger(group, *info, seen, records);

        auto windows = source.list_process_windows(group.pid, options.process_query_timeout);
        if (windows) {
            merger.add_process_windows(*windows);
        } else {
            note(std::format("pid {}: {} ({}), using window-server entries only",
                             group.pid, windows.error().message, to_string(windows.error().kind)));
        }
        merger.add_unmatched_entries();
    }

    return records;
}
