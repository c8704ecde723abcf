#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "vd_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        if (fd >= 0) {
            REQUIRE(::write(fd, content.data(), content.size()) ==
                    static_cast<ssize_t>(content.size()));
            ::close(fd);
        }
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.model.path.empty());
        REQUIRE(cfg.whisper.threads == 4);
        REQUIRE(cfg.whisper.language.empty());
        REQUIRE(cfg.sidecar.binary == "sherpa-onnx-offline");
        REQUIRE(cfg.sidecar.threads == 4);
        REQUIRE(cfg.sidecar.hotwords_score == 2.0);
        REQUIRE(cfg.sidecar.language == "en");
        REQUIRE(cfg.sidecar.task == "transcribe");
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "model": { "path": "/opt/models/ggml-base.en.bin" },
            "whisper": { "threads": 8, "language": "de" },
            "sidecar": {
                "binary": "sherpa-onnx-offline-gpu",
                "resource_dir": "/opt/vox",
                "threads": 2,
                "hotwords_score": 1.5,
                "language": "fr",
                "task": "translate"
            },
            "paths": { "data_dir": "/srv/vox/data", "cache_dir": "/srv/vox/cache" }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.model.path == "/opt/models/ggml-base.en.bin");
        REQUIRE(cfg.whisper.threads == 8);
        REQUIRE(cfg.whisper.language == "de");
        REQUIRE(cfg.sidecar.binary == "sherpa-onnx-offline-gpu");
        REQUIRE(cfg.sidecar.resource_dir == "/opt/vox");
        REQUIRE(cfg.sidecar.threads == 2);
        REQUIRE(cfg.sidecar.hotwords_score == 1.5);
        REQUIRE(cfg.sidecar.language == "fr");
        REQUIRE(cfg.sidecar.task == "translate");
        REQUIRE(cfg.paths.resolved_data_dir() == "/srv/vox/data");
        REQUIRE(cfg.paths.resolved_cache_dir() == "/srv/vox/cache");
    }

    SECTION("DerivedPaths") {
        Config cfg;
        cfg.paths.data_dir = "/srv/vox";
        REQUIRE(cfg.paths.history_db() == "/srv/vox/history.db");
        REQUIRE(cfg.paths.hotwords_file() == "/srv/vox/hotwords.txt");
        REQUIRE(cfg.paths.models_dir() == "/srv/vox/models");
    }

    SECTION("DefaultDirsNotEmpty") {
        Config cfg;
        REQUIRE_FALSE(cfg.paths.resolved_data_dir().empty());
        REQUIRE_FALSE(cfg.paths.resolved_cache_dir().empty());
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "sidecar": { "threads": 1 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.sidecar.threads == 1);
        // Other fields retain defaults
        REQUIRE(cfg.sidecar.binary == "sherpa-onnx-offline");
        REQUIRE(cfg.whisper.threads == 4);
        REQUIRE(cfg.model.path.empty());
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.sidecar.binary == "sherpa-onnx-offline");
        REQUIRE(cfg.whisper.threads == 4);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/vd_test_nonexistent_config_file.json");
        REQUIRE(cfg.sidecar.binary == "sherpa-onnx-offline");
        REQUIRE(cfg.model.path.empty());
    }
}
