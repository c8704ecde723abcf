#include "model_downloader.hpp"

#include <curl/curl.h>
#include <fstream>

namespace fs = std::filesystem;

namespace {

struct TransferState {
    std::ofstream* file;
    const std::string* name;
    ModelDownloader::ProgressCallback* progress;
    uint64_t last_percent = 101;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* st = static_cast<TransferState*>(userdata);
    st->file->write(ptr, static_cast<std::streamsize>(size * nmemb));
    if (!*st->file) return 0; // aborts the transfer
    return size * nmemb;
}

int progress_callback(void* userdata, curl_off_t dltotal, curl_off_t dlnow,
                      curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* st = static_cast<TransferState*>(userdata);
    if (dltotal <= 0 || !*st->progress) return 0;

    auto total = static_cast<uint64_t>(dltotal);
    auto now = static_cast<uint64_t>(dlnow);
    uint64_t percent = now * 100 / total;
    // Only whole-percent steps are reported
    if (percent == st->last_percent) return 0;
    st->last_percent = percent;

    (*st->progress)(DownloadProgress{
        .name = *st->name,
        .percent = percent,
        .downloaded = now,
        .total = total,
    });
    return 0;
}

} // namespace

ModelDownloader::ModelDownloader(fs::path models_dir)
    : models_dir_(std::move(models_dir)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

ModelDownloader::~ModelDownloader() {
    curl_global_cleanup();
}

std::expected<fs::path, std::string>
ModelDownloader::download(const std::string& url, const std::string& name, ProgressCallback progress) {
    if (name.empty()) {
        return std::unexpected("empty destination name");
    }
    fs::path rel(name);
    bool escapes = rel.is_absolute();
    for (const auto& part : rel) {
        if (part == "..") escapes = true;
    }
    if (escapes) {
        return std::unexpected("destination must stay inside the models directory: " + name);
    }

    auto target = models_dir_ / name;
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return std::unexpected("Failed to create " + target.parent_path().string() + ": " + ec.message());
    }

    std::ofstream file(target, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return std::unexpected("Failed to create file: " + target.string());
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        file.close();
        fs::remove(target, ec);
        return std::unexpected("curl_easy_init failed");
    }

    TransferState st{.file = &file, .name = &name, .progress = &progress};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &st);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &st);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_cleanup(curl);
    file.close();

    if (res != CURLE_OK) {
        fs::remove(target, ec);
        return std::unexpected(std::string("Request failed: ") + curl_easy_strerror(res));
    }
    if (!file) {
        fs::remove(target, ec);
        return std::unexpected("Error while writing to file: " + target.string());
    }

    return target;
}
