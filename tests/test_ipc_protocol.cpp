#include <catch2/catch_test_macros.hpp>

#include "platform/linux/unix_socket_client.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>
#include <vector>

using json = nlohmann::json;

namespace {

std::string tmp_socket_path() {
    return "/tmp/ws_test_ipc_" + std::to_string(getpid()) + ".sock";
}

// Polls until at least `count` commands arrived or the client went away.
std::vector<json> read_with_retry(UnixSocketServer& server, int fd, size_t count = 1) {
    std::vector<json> cmds;
    for (int i = 0; i < 200 && cmds.size() < count; ++i) {
        if (!server.read_commands(fd, cmds)) break;
        if (cmds.size() < count) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return cmds;
}

int connect_raw(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return -1;
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

bool write_all(int fd, const std::string& data) {
    return ::write(fd, data.data(), data.size()) == static_cast<ssize_t>(data.size());
}

} // namespace

TEST_CASE("IPC protocol", "[ipc]") {
    auto sock_path = tmp_socket_path();

    SECTION("ServerStartStop") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        REQUIRE(std::filesystem::exists(sock_path));

        struct stat st{};
        REQUIRE(::stat(sock_path.c_str(), &st) == 0);
        REQUIRE((st.st_mode & 0077) == 0);

        server.stop();
        REQUIRE_FALSE(std::filesystem::exists(sock_path));
    }

    SECTION("RejectsOverlongPath") {
        UnixSocketServer server;
        REQUIRE_FALSE(server.start("/tmp/" + std::string(200, 'x') + ".sock"));
    }

    SECTION("RoundTrip") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        json cmd = {{"cmd", "search"}, {"query", "Документ"}};
        REQUIRE(client.send(cmd));

        auto received = read_with_retry(server, client_fd);
        REQUIRE(received.size() == 1);
        REQUIRE(received[0]["cmd"] == "search");
        REQUIRE(received[0]["query"] == "Документ");

        json resp = {{"status", "ok"}, {"windows", json::array()}};
        REQUIRE(server.send_response(client_fd, resp));

        json got;
        REQUIRE(client.recv(got, 1000));
        REQUIRE(got["status"] == "ok");
        REQUIRE(got["windows"].empty());

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("LargeReplyArrivesWhole") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        json windows = json::array();
        for (int i = 0; i < 5000; ++i) {
            windows.push_back({{"id", std::to_string(i)}, {"title", std::string(64, 't')}});
        }

        // The reply exceeds the socket buffer, so the client reads concurrently.
        json got;
        bool received = false;
        std::thread reader([&] { received = client.recv(got, 5000); });
        REQUIRE(server.send_response(client_fd, {{"status", "ok"}, {"windows", windows}}));
        reader.join();

        REQUIRE(received);
        REQUIRE(got["windows"].size() == 5000);
        server.stop();
    }

    SECTION("MalformedRequestBecomesEmptyObject") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        // Raw socket: the client class only ever sends serialized JSON.
        int raw = connect_raw(sock_path);
        REQUIRE(raw >= 0);
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(write_all(raw, "not json {{{\n"));

        auto received = read_with_retry(server, client_fd);
        REQUIRE(received.size() == 1);
        REQUIRE(received[0].is_object());
        REQUIRE(received[0].empty());

        ::close(raw);
        server.stop();
    }

    SECTION("PipelinedCommandsArriveTogether") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        int raw = connect_raw(sock_path);
        REQUIRE(raw >= 0);
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(write_all(raw, "{\"cmd\":\"refresh\"}\n{\"cmd\":\"search\",\"query\":\"x\"}\n"));

        auto received = read_with_retry(server, client_fd, 2);
        REQUIRE(received.size() == 2);
        REQUIRE(received[0]["cmd"] == "refresh");
        REQUIRE(received[1]["cmd"] == "search");

        ::close(raw);
        server.stop();
    }

    SECTION("PartialLineWaitsForTheRest") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        int raw = connect_raw(sock_path);
        REQUIRE(raw >= 0);
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(write_all(raw, "{\"cmd\":\"sta"));
        std::this_thread::sleep_for(std::chrono::milliseconds(5));

        // Half a line keeps the client connected and yields nothing.
        std::vector<json> partial;
        REQUIRE(server.read_commands(client_fd, partial));
        REQUIRE(partial.empty());

        REQUIRE(write_all(raw, "tus\"}\n"));
        auto received = read_with_retry(server, client_fd);
        REQUIRE(received.size() == 1);
        REQUIRE(received[0]["cmd"] == "status");

        ::close(raw);
        server.stop();
    }

    SECTION("NothingToReadIsNotADisconnect") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        std::vector<json> cmds;
        REQUIRE(server.read_commands(client_fd, cmds));
        REQUIRE(cmds.empty());
        server.stop();
    }

    SECTION("DisconnectIsDetected") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        client.close();
        std::this_thread::sleep_for(std::chrono::milliseconds(5));

        std::vector<json> received;
        REQUIRE_FALSE(server.read_commands(client_fd, received));
        REQUIRE(received.empty());
        server.stop();
    }
}
