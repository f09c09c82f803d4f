#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      window_source_(config_.filter.min_width, config_.filter.min_height),
      core_(config_, verbose_, window_source_, ipc_server_,
            // NotifyCallback, runs on the refresh worker
            [this]() {
                uint64_t val = 1;
                if (::write(worker_event_fd_, &val, sizeof(val)) < 0) {
                    std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
                }
            },
            static_cast<int>(::getpid())) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
}

bool LinuxEventLoop::init() {
    if (config_.source.type != "sway") {
        std::println(stderr, "Unknown window source: {}", config_.source.type);
        return false;
    }

    // IPC socket
    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    // Window source (optional at startup; each refresh reconnects)
    if (auto res = window_source_.connect(); res) {
        log("Sway IPC connected");
    } else {
        std::println(stderr, "Sway IPC not available: {}", res.error().message);
    }

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    // Refresh worker notification
    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (worker_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) ||
        !add_fd(ipc_server_.server_fd(), EPOLLIN) ||
        !add_fd(worker_event_fd_, EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) < 0) continue;
                log("Received signal, shutting down");
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev);
                }
                continue;
            }

            if (fd == worker_event_fd_) {
                uint64_t val;
                if (::read(worker_event_fd_, &val, sizeof(val)) < 0) continue;
                core_.on_refresh_complete();
                release_held_commands();
                continue;
            }

            // Client fd
            std::vector<nlohmann::json> cmds;
            if (ipc_server_.read_commands(fd, cmds)) {
                if (auto it = held_commands_.find(fd); it != held_commands_.end()) {
                    it->second.insert(it->second.end(), std::make_move_iterator(cmds.begin()),
                                      std::make_move_iterator(cmds.end()));
                } else {
                    dispatch(fd, std::move(cmds));
                }
            } else {
                epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
                ipc_server_.close_client(fd);
                core_.remove_waiting_client(fd);
                held_commands_.erase(fd);
            }
        }
    }

    core_.shutdown();
}

void LinuxEventLoop::dispatch(int fd, std::vector<nlohmann::json> cmds) {
    for (size_t i = 0; i < cmds.size(); i++) {
        auto& cmd = cmds[i];
        std::string cmd_str = cmd.is_object() && cmd.contains("cmd") && cmd["cmd"].is_string()
                                  ? cmd["cmd"].get<std::string>() : "";
        auto response = core_.handle_command(cmd_str, cmd);

        if (response.value("status", "") != "refreshing") {
            ipc_server_.send_response(fd, response);
            continue;
        }

        core_.add_waiting_client(fd, std::move(cmd));
        // Replies go out in request order, so the rest waits for the refresh.
        auto& held = held_commands_[fd];
        held.insert(held.end(), std::make_move_iterator(cmds.begin() + static_cast<std::ptrdiff_t>(i) + 1),
                    std::make_move_iterator(cmds.end()));
        return;
    }
}

void LinuxEventLoop::release_held_commands() {
    auto held = std::move(held_commands_);
    held_commands_.clear();
    for (auto& [fd, cmds] : held) {
        if (!cmds.empty()) dispatch(fd, std::move(cmds));
    }
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[window-search] {}", msg);
    }
}
