#include "platform/linux/procfs.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <string_view>

namespace fs = std::filesystem;

namespace procfs {

bool process_exists(int pid) {
    if (pid <= 0) return false;
    std::error_code ec;
    return fs::is_directory(std::format("/proc/{}", pid), ec);
}

std::string read_comm(int pid) {
    if (pid <= 0) return {};
    std::ifstream f(std::format("/proc/{}/comm", pid));
    if (!f.is_open()) return {};
    std::string comm;
    std::getline(f, comm);
    return comm;
}

std::string read_exe_name(int pid) {
    if (pid <= 0) return {};
    std::error_code ec;
    auto path = fs::read_symlink(std::format("/proc/{}/exe", pid), ec);
    if (ec) return {};

    // A replaced binary reads as "/usr/bin/foo (deleted)"
    auto name = path.filename().string();
    constexpr std::string_view deleted = " (deleted)";
    if (name.ends_with(deleted)) name.resize(name.size() - deleted.size());
    return name;
}

} // namespace procfs
