#include "window/window_engine.hpp"

#include "window/search.hpp"

#include <algorithm>

namespace {

const WindowEngine::Snapshot& empty_snapshot() {
    static const WindowEngine::Snapshot empty = std::make_shared<const std::vector<WindowRecord>>();
    return empty;
}

} // namespace

std::expected<void, WindowError> activate_window(const WindowRecord& record, WindowSource& source) {
    auto failed = [](const WindowError& e) {
        return std::unexpected(WindowError{WindowErrorKind::ActivationFailed, e.message});
    };

    if (auto res = source.activate_process(record.activation); !res) return failed(res.error());
    if (!record.activation.has_window()) return {};
    if (auto res = source.focus_window(record.activation); !res) return failed(res.error());
    return {};
}

WindowEngine::WindowEngine(WindowSource& source, ReconcileOptions options, LogFn log)
    : source_(source), options_(std::move(options)), log_(std::move(log)),
      records_(empty_snapshot()) {}

std::expected<WindowEngine::Snapshot, WindowError> WindowEngine::refresh() {
    uint64_t generation;
    {
        std::lock_guard lock(mutex_);
        generation = generation_;
    }

    auto result = reconcile(source_, options_, log_);
    if (!result) {
        publish(empty_snapshot(), generation);
        return std::unexpected(result.error());
    }

    auto list = std::make_shared<const std::vector<WindowRecord>>(std::move(*result));
    publish(list, generation);
    return list;
}

void WindowEngine::publish(Snapshot list, uint64_t generation) {
    std::lock_guard lock(mutex_);
    if (generation != generation_) return;

    records_ = std::move(list);
    has_snapshot_ = true;
    last_results_.clear();
    last_refresh_ = Clock::now();
}

WindowEngine::Snapshot WindowEngine::snapshot() const {
    std::lock_guard lock(mutex_);
    return records_;
}

bool WindowEngine::has_snapshot() const {
    std::lock_guard lock(mutex_);
    return has_snapshot_;
}

std::vector<WindowRecord> WindowEngine::search(std::string_view query) {
    auto list = snapshot();
    auto results = ::search(query, *list);

    std::lock_guard lock(mutex_);
    last_results_ = results;
    return results;
}

std::optional<WindowRecord> WindowEngine::find(const std::string& identity) const {
    auto list = snapshot();
    auto it = std::ranges::find(*list, identity, &WindowRecord::identity);
    if (it == list->end()) return std::nullopt;
    return *it;
}

std::optional<WindowRecord> WindowEngine::result_at(size_t index) const {
    std::lock_guard lock(mutex_);
    if (index >= last_results_.size()) return std::nullopt;
    return last_results_[index];
}

std::expected<void, WindowError> WindowEngine::activate(const WindowRecord& record) {
    auto res = activate_window(record, source_);
    if (!res && log_) {
        log_("activation of \"" + record.title + "\" failed: " + res.error().message);
    }
    return res;
}

void WindowEngine::close() {
    std::lock_guard lock(mutex_);
    records_ = empty_snapshot();
    has_snapshot_ = false;
    last_results_.clear();
    last_refresh_.reset();
    generation_++;
}

std::optional<WindowEngine::Clock::time_point> WindowEngine::last_refresh() const {
    std::lock_guard lock(mutex_);
    return last_refresh_;
}
