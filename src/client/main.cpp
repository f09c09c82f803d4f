#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <nlohmann/json.hpp>
#include <print>
#include <string>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [args]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  refresh             Rebuild the window list and print it");
    std::println(stderr, "  search [QUERY...]   List windows whose title or app matches QUERY");
    std::println(stderr, "  pick N              Activate result N of the last search or refresh");
    std::println(stderr, "  activate ID         Activate the window with identity ID");
    std::println(stderr, "  status              Show session status");
    std::println(stderr, "  close               End the search session");
    std::println(stderr, "Options:");
    std::println(stderr, "  --json              Print the raw reply");
}

static void print_windows(const json& windows) {
    int index = 0;
    for (const auto& w : windows) {
        std::println("{:>3}  {}  [{}]{}", index++, w.value("title", ""), w.value("owner", ""),
                     w.value("synthesized", false) ? " *" : "");
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    bool raw = false;
    std::string rest;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--json") {
            raw = true;
            continue;
        }
        if (!rest.empty()) rest += ' ';
        rest += arg;
    }

    json cmd;
    if (command == "refresh" || command == "status" || command == "close") {
        cmd = {{"cmd", command}};
    } else if (command == "search") {
        cmd = {{"cmd", "search"}, {"query", rest}};
    } else if (command == "pick") {
        char* end = nullptr;
        long index = std::strtol(rest.c_str(), &end, 10);
        if (rest.empty() || *end != '\0' || index < 0) {
            std::println(stderr, "pick needs a non-negative result index");
            return 1;
        }
        cmd = {{"cmd", "activate"}, {"index", index}};
    } else if (command == "activate") {
        if (rest.empty()) {
            std::println(stderr, "activate needs a window id");
            return 1;
        }
        cmd = {{"cmd", "activate"}, {"id", rest}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is window-search running?");
        return 1;
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    json response;
    if (!client.recv(response)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    if (raw) {
        std::println("{}", response.dump(2));
        return response.value("status", "") == "ok" ? 0 : 1;
    }

    auto status = response.value("status", "");
    if (status == "error") {
        std::println(stderr, "Error ({}): {}", response.value("kind", "unknown"),
                     response.value("message", "unknown error"));
        return 1;
    }

    if (command == "status") {
        std::println("Session: {}", response.value("session", false) ? "open" : "closed");
        std::println("Windows: {}", response.value("windows", 0));
        std::println("Refreshing: {}", response.value("refreshing", false) ? "yes" : "no");
        if (response.contains("last_refresh") && response["last_refresh"].is_string()) {
            std::println("Last refresh: {}", response["last_refresh"].get<std::string>());
        }
    } else if (response.contains("windows")) {
        print_windows(response["windows"]);
    } else if (response.contains("window")) {
        std::println("{}", response["window"].value("title", ""));
    } else {
        std::println("OK");
    }

    return 0;
}
