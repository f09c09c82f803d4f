#include "platform/linux/sway_ipc.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <limits>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

SwayIpc::SwayIpc() = default;

SwayIpc::~SwayIpc() {
    std::lock_guard lock(mutex_);
    close_locked();
}

std::expected<void, WindowError> SwayIpc::connect(const std::string& socket_path) {
    std::lock_guard lock(mutex_);

    if (!socket_path.empty()) {
        sock_path_ = socket_path;
    } else {
        const char* sock = std::getenv("SWAYSOCK");
        if (!sock || !*sock) {
            return std::unexpected(WindowError{WindowErrorKind::SourceUnavailable,
                                               "$SWAYSOCK not set"});
        }
        sock_path_ = sock;
    }

    return reconnect_locked();
}

bool SwayIpc::connected() const {
    std::lock_guard lock(mutex_);
    return fd_ >= 0;
}

std::expected<std::string, WindowError> SwayIpc::request(uint32_t type, const std::string& payload,
                                                         std::chrono::milliseconds timeout) {
    std::lock_guard lock(mutex_);

    if (fd_ < 0) {
        if (sock_path_.empty()) {
            return std::unexpected(WindowError{WindowErrorKind::SourceUnavailable,
                                               "sway: not connected"});
        }
        if (auto res = reconnect_locked(); !res) return std::unexpected(res.error());
    }

    if (!send_message(type, payload)) {
        close_locked();
        return std::unexpected(WindowError{WindowErrorKind::SourceUnavailable,
                                           std::format("sway: send failed: {}", std::strerror(errno))});
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool timed_out = false;

    char header[HEADER_SIZE];
    if (!recv_exact(header, HEADER_SIZE, deadline, timed_out) ||
        std::memcmp(header, MAGIC, 6) != 0) {
        close_locked();
        if (timed_out) {
            return std::unexpected(WindowError{WindowErrorKind::AccessibilityTimeout,
                                               std::format("sway: no reply within {}ms", timeout.count())});
        }
        return std::unexpected(WindowError{WindowErrorKind::SourceUnavailable,
                                           "sway: connection lost"});
    }

    uint32_t len;
    uint32_t reply_type;
    std::memcpy(&len, header + 6, 4);
    std::memcpy(&reply_type, header + 10, 4);

    std::string reply(len, '\0');
    if (!recv_exact(reply.data(), len, deadline, timed_out) || reply_type != type) {
        close_locked();
        if (timed_out) {
            return std::unexpected(WindowError{WindowErrorKind::AccessibilityTimeout,
                                               std::format("sway: reply truncated after {}ms", timeout.count())});
        }
        return std::unexpected(WindowError{WindowErrorKind::SourceUnavailable,
                                           "sway: malformed reply"});
    }

    return reply;
}

std::expected<void, WindowError> SwayIpc::reconnect_locked() {
    close_locked();

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return std::unexpected(WindowError{WindowErrorKind::SourceUnavailable,
                                           std::format("sway: socket() failed: {}", std::strerror(errno))});
    }

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, sock_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        ::close(fd);
        auto kind = (err == EACCES || err == EPERM) ? WindowErrorKind::PermissionDenied
                                                    : WindowErrorKind::SourceUnavailable;
        return std::unexpected(WindowError{kind,
                                           std::format("sway: connect {} failed: {}", sock_path_, std::strerror(err))});
    }

    fd_ = fd;
    return {};
}

void SwayIpc::close_locked() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool SwayIpc::send_message(uint32_t type, const std::string& payload) {
    uint32_t len = static_cast<uint32_t>(payload.size());
    char header[HEADER_SIZE];
    std::memcpy(header, MAGIC, 6);
    std::memcpy(header + 6, &len, 4);
    std::memcpy(header + 10, &type, 4);

    if (::send(fd_, header, HEADER_SIZE, MSG_NOSIGNAL) != static_cast<ssize_t>(HEADER_SIZE))
        return false;
    if (len > 0) {
        if (::send(fd_, payload.data(), len, MSG_NOSIGNAL) != static_cast<ssize_t>(len))
            return false;
    }
    return true;
}

bool SwayIpc::recv_exact(char* buf, size_t len, std::chrono::steady_clock::time_point deadline,
                         bool& timed_out) {
    size_t read_total = 0;
    while (read_total < len) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timed_out = true;
            return false;
        }

        pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
        auto wait_ms = std::min<std::chrono::milliseconds::rep>(remaining.count(),
                                                               std::numeric_limits<int>::max());
        int ret = ::poll(&pfd, 1, static_cast<int>(wait_ms));
        if (ret < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (ret == 0) {
            timed_out = true;
            return false;
        }

        ssize_t n = ::recv(fd_, buf + read_total, len - read_total, 0);
        if (n <= 0) return false;
        read_total += static_cast<size_t>(n);
    }
    return true;
}
