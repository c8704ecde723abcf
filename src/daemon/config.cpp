#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string Config::Paths::resolved_data_dir() const {
    if (!data_dir.empty()) return data_dir;
    auto dir = platform::data_dir();
    return dir.empty() ? "/tmp/vox-dispatch" : dir;
}

std::string Config::Paths::resolved_cache_dir() const {
    if (!cache_dir.empty()) return cache_dir;
    return platform::cache_dir();
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("model")) {
            auto& m = j["model"];
            if (m.contains("path")) cfg.model.path = m["path"].get<std::string>();
        }

        if (j.contains("whisper")) {
            auto& w = j["whisper"];
            if (w.contains("threads")) cfg.whisper.threads = w["threads"].get<int>();
            if (w.contains("language")) cfg.whisper.language = w["language"].get<std::string>();
        }

        if (j.contains("sidecar")) {
            auto& s = j["sidecar"];
            if (s.contains("binary")) cfg.sidecar.binary = s["binary"].get<std::string>();
            if (s.contains("resource_dir")) cfg.sidecar.resource_dir = s["resource_dir"].get<std::string>();
            if (s.contains("threads")) cfg.sidecar.threads = s["threads"].get<int>();
            if (s.contains("hotwords_score")) cfg.sidecar.hotwords_score = s["hotwords_score"].get<double>();
            if (s.contains("language")) cfg.sidecar.language = s["language"].get<std::string>();
            if (s.contains("task")) cfg.sidecar.task = s["task"].get<std::string>();
        }

        if (j.contains("paths")) {
            auto& p = j["paths"];
            if (p.contains("data_dir")) cfg.paths.data_dir = p["data_dir"].get<std::string>();
            if (p.contains("cache_dir")) cfg.paths.cache_dir = p["cache_dir"].get<std::string>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
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
