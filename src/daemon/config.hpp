#pragma once

#include <string>

struct Config {
    struct Model {
        // Loaded at start-up when set
        std::string path;
    } model;

    struct Whisper {
        int threads = 4;
        std::string language; // empty keeps the model default
    } whisper;

    struct Sidecar {
        std::string binary = "sherpa-onnx-offline";
        std::string resource_dir; // empty: platform::resource_dir()
        int threads = 4;
        double hotwords_score = 2.0;
        std::string language = "en";
        std::string task = "transcribe";
    } sidecar;

    struct Paths {
        std::string data_dir;  // empty: platform::data_dir()
        std::string cache_dir; // empty: platform::cache_dir()

        std::string resolved_data_dir() const;
        std::string resolved_cache_dir() const;
        std::string history_db() const { return resolved_data_dir() + "/history.db"; }
        std::string hotwords_file() const { return resolved_data_dir() + "/hotwords.txt"; }
        std::string models_dir() const { return resolved_data_dir() + "/models"; }
    } paths;

    static Config load(const std::string& path);
    static Config load_default();
};
