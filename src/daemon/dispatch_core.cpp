#include "dispatch_core.hpp"

#include "audio/wav_decoder.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::expected<std::vector<uint8_t>, Error> read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected(Error{ErrorKind::Io, "could not open " + path});
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (f.bad()) {
        return std::unexpected(Error{ErrorKind::Io, "read failed for " + path});
    }
    return bytes;
}

} // namespace

json error_response(const Error& error) {
    return {{"status", "error"}, {"kind", to_string(error.kind)}, {"message", error.message}};
}

DispatchCore::DispatchCore(Config config, bool verbose, IpcServer& ipc,
                           Engine::BackendFactory backend_factory, NotifyCallback notify)
    : config_(std::move(config)), verbose_(verbose),
      ipc_(ipc), notify_(std::move(notify)),
      engine_(std::move(backend_factory)),
      vocabulary_(config_.paths.hotwords_file()),
      downloader_(config_.paths.models_dir()) {}

DispatchCore::~DispatchCore() {
    shutdown();
}

bool DispatchCore::init() {
    auto db_path = config_.paths.history_db();
    if (!history_db_.open(db_path)) {
        std::println(stderr, "Warning: history DB failed to open, history disabled");
    }

    if (!config_.model.path.empty()) {
        log("Loading default model from: " + config_.model.path);
        auto label = engine_.load(config_.model.path);
        if (label) {
            log("Model loaded: " + *label);
        } else {
            std::println(stderr, "Failed to load default model: {}", label.error().message);
        }
    }

    return true;
}

json DispatchCore::handle_command(int client_fd, const std::string& cmd_str, const json& cmd) {
    try {
        return dispatch(client_fd, cmd_str, cmd);
    } catch (const json::type_error& e) {
        // A field present with the wrong type
        log(std::format("Rejected {} request: {}", cmd_str, e.what()));
        return {{"status", "error"}, {"message", "invalid request"}};
    }
}

json DispatchCore::dispatch(int client_fd, const std::string& cmd_str, const json& cmd) {
    if (cmd_str == "load") return handle_load(client_fd, cmd);
    if (cmd_str == "model") return handle_model(client_fd, cmd);
    if (cmd_str == "transcribe") return handle_transcribe(client_fd, cmd);
    if (cmd_str == "history") return handle_history(cmd);
    if (cmd_str == "delete") return handle_delete(cmd);
    if (cmd_str == "stats") return handle_stats(cmd);
    if (cmd_str == "vocabulary") return handle_vocabulary(cmd);
    if (cmd_str == "download") return handle_download(client_fd, cmd);
    if (cmd_str == "status") return handle_status(cmd);
    return {{"status", "error"}, {"message", "unknown command"}};
}

json DispatchCore::handle_load(int client_fd, const json& cmd) {
    std::string path = cmd.value("path", "");
    if (path.empty()) {
        return {{"status", "error"}, {"message", "missing model path"}};
    }

    return start_job(client_fd, [this, path]() -> json {
        log("Loading new model from: " + path);
        auto label = engine_.load(path);
        if (!label) {
            log("Model load failed: " + label.error().message);
            return error_response(label.error());
        }
        log("Model loaded: " + *label);
        return {{"status", "ok"}, {"model", *label}};
    });
}

json DispatchCore::handle_model(int client_fd, const json& /*cmd*/) {
    // The label shares the engine guard, so this waits behind a running transcription
    return start_job(client_fd, [this]() -> json {
        auto label = engine_.current_label();
        if (!label) return error_response(label.error());
        return {{"status", "ok"}, {"model", *label}};
    });
}

json DispatchCore::handle_transcribe(int client_fd, const json& cmd) {
    std::string path = cmd.value("path", "");
    if (path.empty()) {
        return {{"status", "error"}, {"message", "missing audio path"}};
    }
    std::string title = cmd.value("title", "");
    bool save = cmd.value("save", true);

    return start_job(client_fd, [this, path, title, save]() {
        return transcribe_file(path, title, save);
    });
}

json DispatchCore::transcribe_file(const std::string& path, const std::string& title, bool save) {
    auto bytes = read_file(path);
    if (!bytes) return error_response(bytes.error());
    log(std::format("Transcribing {} ({} bytes)", path, bytes->size()));

    auto audio = audio::normalize(*bytes);
    if (!audio) {
        log("Audio rejected: " + audio.error().message);
        return error_response(audio.error());
    }

    double duration = static_cast<double>(audio->size()) / audio::target_sample_rate;
    log(std::format("Audio loaded, {} samples ({:.1f}s)", audio->size(), duration));

    auto start = std::chrono::steady_clock::now();
    auto result = engine_.transcribe_labeled(*audio);
    auto end = std::chrono::steady_clock::now();
    double processing_s = std::chrono::duration<double>(end - start).count();

    if (!result) {
        log("Transcription failed: " + result.error().message);
        return error_response(result.error());
    }

    log(std::format("Transcription complete: {:.1f}s processing, {} chars",
                    processing_s, result->text.size()));

    json response = {
        {"status", "ok"},
        {"text", result->text},
        {"duration", duration},
        {"processing_time", processing_s},
    };

    if (save) {
        HistoryRecord record{
            .transcript = result->text,
            .filename = fs::path(path).filename().string(),
            .title = title,
            .duration = duration,
            .processing_time = processing_s,
            .app_name = "Unknown",
            .model = result->model,
        };

        std::lock_guard lock(history_mutex_);
        if (auto id = history_db_.insert(record)) {
            response["id"] = *id;
        } else {
            log("History insert failed, transcript not saved");
        }
    }

    return response;
}

json DispatchCore::handle_history(const json& cmd) {
    int limit = cmd.value("limit", 10);

    std::vector<HistoryEntry> entries;
    {
        std::lock_guard lock(history_mutex_);
        entries = history_db_.recent(limit);
    }

    json resp = {{"status", "ok"}, {"entries", json::array()}};
    for (auto& e : entries) {
        resp["entries"].push_back({
            {"id", e.id},
            {"timestamp", e.timestamp},
            {"text", e.record.transcript},
            {"filename", e.record.filename},
            {"title", e.record.title},
            {"duration", e.record.duration},
            {"processing_time", e.record.processing_time},
            {"app_name", e.record.app_name},
            {"model", e.record.model},
        });
    }
    return resp;
}

json DispatchCore::handle_delete(const json& cmd) {
    if (!cmd.contains("id") || !cmd["id"].is_number_integer()) {
        return {{"status", "error"}, {"message", "missing history id"}};
    }

    std::lock_guard lock(history_mutex_);
    // Deleting an id that is already gone is not an error
    history_db_.remove(cmd["id"].get<int64_t>());
    return {{"status", "ok"}};
}

json DispatchCore::handle_stats(const json& /*cmd*/) {
    DashboardStats s;
    {
        std::lock_guard lock(history_mutex_);
        s = history_db_.stats();
    }
    return {
        {"status", "ok"},
        {"wpm", s.wpm},
        {"words_this_week", s.words_this_week},
        {"apps_used", s.apps_used},
        {"saved_time", s.saved_time},
    };
}

json DispatchCore::handle_vocabulary(const json& cmd) {
    if (cmd.contains("words")) {
        if (!cmd["words"].is_array()) {
            return {{"status", "error"}, {"message", "words must be an array"}};
        }
        std::vector<std::string> words;
        try {
            words = cmd["words"].get<std::vector<std::string>>();
        } catch (const json::exception& e) {
            return {{"status", "error"}, {"message", std::string("invalid words: ") + e.what()}};
        }
        if (auto res = vocabulary_.save(words); !res) {
            return {{"status", "error"}, {"message", res.error()}};
        }
        log(std::format("Vocabulary saved, {} words", words.size()));
    }

    auto words = vocabulary_.load();
    if (!words) {
        return {{"status", "error"}, {"message", words.error()}};
    }
    return {{"status", "ok"}, {"words", *words}};
}

json DispatchCore::handle_download(int client_fd, const json& cmd) {
    std::string url = cmd.value("url", "");
    std::string name = cmd.value("name", "");
    if (url.empty() || name.empty()) {
        return {{"status", "error"}, {"message", "download needs url and name"}};
    }

    return start_job(client_fd, [this, url, name]() -> json {
        log(std::format("Downloading {} to {}", url, (downloader_.models_dir() / name).string()));

        auto path = downloader_.download(url, name, [this](const DownloadProgress& p) {
            std::lock_guard lock(downloads_mutex_);
            downloads_[p.name] = p;
        });

        {
            std::lock_guard lock(downloads_mutex_);
            downloads_.erase(name);
        }

        if (!path) {
            log("Download failed: " + path.error());
            return {{"status", "error"}, {"message", path.error()}};
        }
        log("Download complete: " + path->string());
        return {{"status", "ok"}, {"path", path->string()}};
    });
}

json DispatchCore::handle_status(const json& /*cmd*/) {
    json resp = {{"status", "ok"}, {"jobs", jobs_.size()}, {"downloads", json::array()}};

    std::lock_guard lock(downloads_mutex_);
    for (auto& [name, p] : downloads_) {
        resp["downloads"].push_back({
            {"filename", p.name},
            {"progress", p.percent},
            {"downloaded", p.downloaded},
            {"total", p.total},
        });
    }
    return resp;
}

json DispatchCore::start_job(int client_fd, JobFn fn) {
    uint64_t id = next_job_id_++;

    jobs_.push_back(Job{
        .id = id,
        .client_fd = client_fd,
        .thread = std::jthread([this, id, fn = std::move(fn)](std::stop_token) {
            json response = fn();
            {
                std::lock_guard lock(completed_mutex_);
                completed_.push_back({id, std::move(response)});
            }
            notify_();
        }),
    });

    return {{"status", "pending"}};
}

void DispatchCore::on_jobs_complete() {
    std::vector<Completed> done;
    {
        std::lock_guard lock(completed_mutex_);
        done.swap(completed_);
    }

    for (auto& c : done) {
        auto it = std::ranges::find_if(jobs_, [&](const Job& j) { return j.id == c.id; });
        if (it == jobs_.end()) continue;

        if (it->thread.joinable()) it->thread.join();
        if (it->client_fd >= 0) {
            ipc_.send_response(it->client_fd, c.response);
        }
        jobs_.erase(it);
    }
}

void DispatchCore::remove_waiting_client(int fd) {
    for (auto& job : jobs_) {
        if (job.client_fd == fd) job.client_fd = -1;
    }
}

void DispatchCore::shutdown() {
    if (!jobs_.empty()) {
        log(std::format("Waiting for {} pending job(s) to complete...", jobs_.size()));
    }
    for (auto& job : jobs_) {
        if (job.thread.joinable()) job.thread.join();
    }
    on_jobs_complete();
}

void DispatchCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[vox-dispatch] {}", msg);
    }
}
