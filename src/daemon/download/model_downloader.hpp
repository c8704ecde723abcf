#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <string>

struct DownloadProgress {
    std::string name;
    uint64_t percent = 0;
    uint64_t downloaded = 0;
    uint64_t total = 0;
};

// Fetches model files into the models directory over libcurl.
class ModelDownloader {
public:
    using ProgressCallback = std::function<void(const DownloadProgress&)>;

    explicit ModelDownloader(std::filesystem::path models_dir);
    ~ModelDownloader();

    ModelDownloader(const ModelDownloader&) = delete;
    ModelDownloader& operator=(const ModelDownloader&) = delete;

    // `name` may contain subdirectories. Progress is reported only once the
    // total size is known. A failed download leaves no partial file.
    std::expected<std::filesystem::path, std::string>
        download(const std::string& url, const std::string& name, ProgressCallback progress = {});

    const std::filesystem::path& models_dir() const { return models_dir_; }

private:
    std::filesystem::path models_dir_;
};
