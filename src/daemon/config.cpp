#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("source")) {
            auto& s = j["source"];
            if (s.contains("type")) cfg.source.type = s["type"].get<std::string>();
            if (s.contains("process_query_timeout_ms")) {
                auto ms = s["process_query_timeout_ms"].get<int64_t>();
                if (ms > 0 && ms <= Config::MAX_PROCESS_QUERY_TIMEOUT_MS) {
                    cfg.source.process_query_timeout_ms = static_cast<uint32_t>(ms);
                } else {
                    std::println(stderr, "config: process_query_timeout_ms {} out of range (1-{}), using {}",
                                 ms, Config::MAX_PROCESS_QUERY_TIMEOUT_MS,
                                 cfg.source.process_query_timeout_ms);
                }
            }
        }

        if (j.contains("filter")) {
            auto& fl = j["filter"];
            if (fl.contains("min_width")) cfg.filter.min_width = fl["min_width"].get<int>();
            if (fl.contains("min_height")) cfg.filter.min_height = fl["min_height"].get<int>();
            if (fl.contains("denylist"))
                cfg.filter.denylist = fl["denylist"].get<std::vector<std::string>>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
