#pragma once

#include "config.hpp"
#include "download/model_downloader.hpp"
#include "engine/engine.hpp"
#include "error.hpp"
#include "platform/ipc_server.hpp"
#include "storage/history_db.hpp"
#include "storage/vocabulary_store.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>

// Platform-neutral request handling. Inline commands answer immediately;
// load, model, transcribe and download run on their own worker thread and
// answer through on_jobs_complete() once the event loop is notified.
class DispatchCore {
public:
    using NotifyCallback = std::function<void()>;

    DispatchCore(Config config, bool verbose, IpcServer& ipc,
                 Engine::BackendFactory backend_factory, NotifyCallback notify);
    ~DispatchCore();

    DispatchCore(const DispatchCore&) = delete;
    DispatchCore& operator=(const DispatchCore&) = delete;

    bool init();

    // Returns {"status": "pending"} when the answer is deferred to a worker.
    nlohmann::json handle_command(int client_fd, const std::string& cmd_str,
                                  const nlohmann::json& cmd);

    // Joins finished workers and sends their responses.
    void on_jobs_complete();

    // The client went away; its pending answers are dropped.
    void remove_waiting_client(int fd);

    size_t active_jobs() const { return jobs_.size(); }

    void shutdown();

private:
    nlohmann::json dispatch(int client_fd, const std::string& cmd_str, const nlohmann::json& cmd);
    nlohmann::json handle_load(int client_fd, const nlohmann::json& cmd);
    nlohmann::json handle_model(int client_fd, const nlohmann::json& cmd);
    nlohmann::json handle_transcribe(int client_fd, const nlohmann::json& cmd);
    nlohmann::json handle_history(const nlohmann::json& cmd);
    nlohmann::json handle_delete(const nlohmann::json& cmd);
    nlohmann::json handle_stats(const nlohmann::json& cmd);
    nlohmann::json handle_vocabulary(const nlohmann::json& cmd);
    nlohmann::json handle_download(int client_fd, const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);

    nlohmann::json transcribe_file(const std::string& path, const std::string& title, bool save);

    using JobFn = std::function<nlohmann::json()>;
    nlohmann::json start_job(int client_fd, JobFn fn);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    IpcServer& ipc_;
    NotifyCallback notify_;

    Engine engine_;

    std::mutex history_mutex_;
    HistoryDb history_db_;

    VocabularyStore vocabulary_;
    ModelDownloader downloader_;

    std::mutex downloads_mutex_;
    std::map<std::string, DownloadProgress> downloads_;

    // jobs_ is touched only by the event loop thread
    struct Job {
        uint64_t id;
        int client_fd;
        std::jthread thread;
    };
    std::vector<Job> jobs_;
    uint64_t next_job_id_ = 1;

    struct Completed {
        uint64_t id;
        nlohmann::json response;
    };
    std::mutex completed_mutex_;
    std::vector<Completed> completed_;
};

nlohmann::json error_response(const Error& error);
