#pragma once

#include "window/window_error.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <mutex>
#include <string>

// Request/reply client for the i3-ipc protocol spoken by Sway. Thread-safe:
// one request is in flight at a time.
class SwayIpc {
public:
    static constexpr uint32_t MSG_RUN_COMMAND = 0;
    static constexpr uint32_t MSG_GET_TREE = 4;

    SwayIpc();
    ~SwayIpc();

    SwayIpc(const SwayIpc&) = delete;
    SwayIpc& operator=(const SwayIpc&) = delete;

    // Connect to $SWAYSOCK (or `socket_path` when given).
    std::expected<void, WindowError> connect(const std::string& socket_path = "");

    bool connected() const;

    // Sends one message and waits up to `timeout` for its reply payload.
    // After a timeout the connection is reset, so a late reply can never be
    // read as the answer to the next request.
    std::expected<std::string, WindowError> request(uint32_t type, const std::string& payload,
                                                    std::chrono::milliseconds timeout);

private:
    // "i3-ipc" + length (4 bytes) + type (4 bytes)
    static constexpr char MAGIC[] = "i3-ipc";
    static constexpr size_t HEADER_SIZE = 14;

    std::expected<void, WindowError> reconnect_locked();
    void close_locked();

    bool send_message(uint32_t type, const std::string& payload);
    bool recv_exact(char* buf, size_t len, std::chrono::steady_clock::time_point deadline,
                    bool& timed_out);

    mutable std::mutex mutex_;
    int fd_ = -1;
    std::string sock_path_;
};
