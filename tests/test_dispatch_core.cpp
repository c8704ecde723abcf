#include <catch2/catch_test_macros.hpp>

#include "audio/wav_encoder.hpp"
#include "dispatch_core.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

// Captures responses instead of writing to sockets.
class FakeIpcServer : public IpcServer {
public:
    bool start(const std::string&) override { return true; }
    void stop() override {}
    int server_fd() const override { return -1; }
    int accept_client() override { return -1; }
    ReadStatus read_command(int, json&) override { return ReadStatus::Closed; }
    bool send_response(int client_fd, const json& response) override {
        sent.emplace_back(client_fd, response);
        return true;
    }
    void close_client(int) override {}

    std::vector<std::pair<int, json>> sent;
};

class EchoBackend : public TranscriptionBackend {
public:
    std::expected<std::string, Error> transcribe(std::span<const float> audio) override {
        return "heard " + std::to_string(audio.size()) + " samples";
    }
};

struct TmpDir {
    fs::path root;

    TmpDir() {
        root = fs::temp_directory_path() / ("vd_test_core_" + std::to_string(getpid()));
        fs::remove_all(root);
        fs::create_directories(root);
    }

    ~TmpDir() { fs::remove_all(root); }

    fs::path wav(const std::string& name, size_t samples, uint32_t rate = 16000) const {
        std::vector<float> audio(samples, 0.25f);
        auto bytes = wav::encode(audio, rate);
        auto p = root / name;
        std::ofstream f(p, std::ios::binary);
        f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        return p;
    }
};

struct Harness {
    TmpDir tmp;
    FakeIpcServer ipc;
    std::atomic<int> notified{0};
    std::atomic<int> factory_calls{0};
    DispatchCore core;

    static Config make_config(const TmpDir& tmp) {
        Config cfg;
        cfg.paths.data_dir = (tmp.root / "data").string();
        cfg.paths.cache_dir = (tmp.root / "cache").string();
        return cfg;
    }

    Harness()
        : core(make_config(tmp), false, ipc,
               [this](const ModelDescriptor&) -> std::expected<std::unique_ptr<TranscriptionBackend>, Error> {
                   ++factory_calls;
                   return std::make_unique<EchoBackend>();
               },
               [this] { ++notified; }) {
        REQUIRE(core.init());
    }

    // Issues a worker command and returns the deferred answer.
    json run_job(int fd, const json& cmd) {
        int before = notified.load();
        auto immediate = core.handle_command(fd, cmd.value("cmd", ""), cmd);
        if (immediate.value("status", "") != "pending") return immediate;

        auto deadline = std::chrono::steady_clock::now() + 5s;
        while (notified.load() == before && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(1ms);
        }
        size_t sent_before = ipc.sent.size();
        core.on_jobs_complete();
        REQUIRE(ipc.sent.size() == sent_before + 1);
        REQUIRE(ipc.sent.back().first == fd);
        return ipc.sent.back().second;
    }

    json inline_cmd(const json& cmd) {
        return core.handle_command(7, cmd.value("cmd", ""), cmd);
    }

    fs::path fake_model() const {
        auto p = tmp.root / "ggml-fake.bin";
        std::ofstream(p) << "ggml";
        return p;
    }
};

} // namespace

TEST_CASE("DispatchCore", "[core]") {
    Harness h;

    SECTION("TranscribeWithoutModel") {
        auto wav = h.tmp.wav("a.wav", 1600);
        auto resp = h.run_job(5, {{"cmd", "transcribe"}, {"path", wav.string()}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["kind"] == "NoEngineLoadedError");
        REQUIRE(resp["message"] == "No model loaded");
    }

    SECTION("ModelStartsAsNone") {
        auto resp = h.run_job(5, {{"cmd", "model"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["model"] == "None");
    }

    SECTION("LoadThenTranscribe") {
        auto resp = h.run_job(5, {{"cmd", "load"}, {"path", h.fake_model().string()}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["model"] == "ggml-fake.bin");
        REQUIRE(h.factory_calls == 1);

        auto wav = h.tmp.wav("meeting.wav", 32000);
        resp = h.run_job(6, {{"cmd", "transcribe"}, {"path", wav.string()}, {"title", "standup"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["text"] == "heard 32000 samples");
        REQUIRE(resp["duration"].get<double>() == 2.0);
        REQUIRE(resp.contains("id"));

        auto hist = h.inline_cmd({{"cmd", "history"}, {"limit", 5}});
        REQUIRE(hist["entries"].size() == 1);
        auto& e = hist["entries"][0];
        REQUIRE(e["text"] == "heard 32000 samples");
        REQUIRE(e["filename"] == "meeting.wav");
        REQUIRE(e["title"] == "standup");
        REQUIRE(e["app_name"] == "Unknown");
        REQUIRE(e["model"] == "ggml-fake.bin");
    }

    SECTION("TranscribeWithoutSaving") {
        REQUIRE(h.run_job(5, {{"cmd", "load"}, {"path", h.fake_model().string()}})["status"] == "ok");

        auto wav = h.tmp.wav("quick.wav", 1600);
        auto resp = h.run_job(5, {{"cmd", "transcribe"}, {"path", wav.string()}, {"save", false}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE_FALSE(resp.contains("id"));
        REQUIRE(h.inline_cmd({{"cmd", "history"}})["entries"].empty());
    }

    SECTION("LoadFailureReportsKind") {
        auto resp = h.run_job(5, {{"cmd", "load"}, {"path", (h.tmp.root / "nope").string()}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["kind"] == "ModelNotFoundError");
        REQUIRE(h.run_job(5, {{"cmd", "model"}})["model"] == "None");
    }

    SECTION("WrongSampleRate") {
        REQUIRE(h.run_job(5, {{"cmd", "load"}, {"path", h.fake_model().string()}})["status"] == "ok");
        auto wav = h.tmp.wav("cd.wav", 4410, 44100);
        auto resp = h.run_job(5, {{"cmd", "transcribe"}, {"path", wav.string()}});
        REQUIRE(resp["kind"] == "SampleRateError");
    }

    SECTION("UnreadableAudio") {
        auto resp = h.run_job(5, {{"cmd", "transcribe"}, {"path", (h.tmp.root / "missing.wav").string()}});
        REQUIRE(resp["kind"] == "IoError");
    }

    SECTION("MissingArguments") {
        REQUIRE(h.inline_cmd({{"cmd", "load"}})["status"] == "error");
        REQUIRE(h.inline_cmd({{"cmd", "transcribe"}})["status"] == "error");
        REQUIRE(h.inline_cmd({{"cmd", "download"}, {"url", "file:///x"}})["status"] == "error");
        REQUIRE(h.inline_cmd({{"cmd", "delete"}})["status"] == "error");
        REQUIRE(h.core.active_jobs() == 0);
    }

    SECTION("UnknownCommand") {
        auto resp = h.inline_cmd({{"cmd", "dance"}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["message"] == "unknown command");
    }

    SECTION("WrongTypedFieldsAreRejected") {
        auto wav = h.tmp.wav("typed.wav", 1600).string();
        std::vector<json> requests = {
            {{"cmd", "load"}, {"path", 42}},
            {{"cmd", "transcribe"}, {"path", 42}},
            {{"cmd", "transcribe"}, {"path", wav}, {"title", 7}},
            {{"cmd", "transcribe"}, {"path", wav}, {"save", "yes"}},
            {{"cmd", "history"}, {"limit", "ten"}},
            {{"cmd", "download"}, {"url", 1}, {"name", "x.bin"}},
            {{"cmd", "download"}, {"url", "file:///x"}, {"name", json::array()}},
        };
        for (const auto& req : requests) {
            auto resp = h.inline_cmd(req);
            REQUIRE(resp["status"] == "error");
            REQUIRE(resp["message"] == "invalid request");
        }
        REQUIRE(h.core.active_jobs() == 0);

        // The core keeps serving afterwards
        REQUIRE(h.inline_cmd({{"cmd", "status"}})["status"] == "ok");
    }

    SECTION("DeleteHistory") {
        REQUIRE(h.run_job(5, {{"cmd", "load"}, {"path", h.fake_model().string()}})["status"] == "ok");
        auto wav = h.tmp.wav("a.wav", 1600);
        auto resp = h.run_job(5, {{"cmd", "transcribe"}, {"path", wav.string()}});
        auto id = resp["id"].get<int64_t>();

        REQUIRE(h.inline_cmd({{"cmd", "delete"}, {"id", id}})["status"] == "ok");
        REQUIRE(h.inline_cmd({{"cmd", "history"}})["entries"].empty());
    }

    SECTION("Stats") {
        auto resp = h.inline_cmd({{"cmd", "stats"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["wpm"] == 0);
        REQUIRE(resp["words_this_week"] == 0);
        REQUIRE(resp["apps_used"] == 0);
        REQUIRE(resp["saved_time"] == "0 minutes");
    }

    SECTION("Vocabulary") {
        auto resp = h.inline_cmd({{"cmd", "vocabulary"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["words"].empty());

        resp = h.inline_cmd({{"cmd", "vocabulary"}, {"words", {"kubernetes", "grafana"}}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["words"] == json({"kubernetes", "grafana"}));
        REQUIRE(fs::exists(h.tmp.root / "data" / "hotwords.txt"));

        resp = h.inline_cmd({{"cmd", "vocabulary"}, {"words", "not a list"}});
        REQUIRE(resp["status"] == "error");
    }

    SECTION("Status") {
        auto resp = h.inline_cmd({{"cmd", "status"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["jobs"] == 0);
        REQUIRE(resp["downloads"].empty());
    }

    SECTION("Download") {
        auto src = h.tmp.root / "remote.bin";
        std::ofstream(src) << std::string(4096, 'x');

        auto resp = h.run_job(5, {{"cmd", "download"}, {"url", "file://" + src.string()}, {"name", "tiny.bin"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["path"] == (h.tmp.root / "data" / "models" / "tiny.bin").string());
        REQUIRE(fs::file_size(h.tmp.root / "data" / "models" / "tiny.bin") == 4096);
        REQUIRE(h.inline_cmd({{"cmd", "status"}})["downloads"].empty());
    }

    SECTION("DisconnectedClientGetsNothing") {
        int before = h.notified.load();
        auto resp = h.core.handle_command(9, "model", {{"cmd", "model"}});
        REQUIRE(resp["status"] == "pending");
        h.core.remove_waiting_client(9);

        auto deadline = std::chrono::steady_clock::now() + 5s;
        while (h.notified.load() == before && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(1ms);
        }
        h.core.on_jobs_complete();
        REQUIRE(h.ipc.sent.empty());
        REQUIRE(h.core.active_jobs() == 0);
    }

    SECTION("ShutdownDrainsJobs") {
        REQUIRE(h.core.handle_command(3, "model", {{"cmd", "model"}})["status"] == "pending");
        h.core.shutdown();
        REQUIRE(h.core.active_jobs() == 0);
        REQUIRE(h.ipc.sent.size() == 1);
        REQUIRE(h.ipc.sent[0].first == 3);
    }
}
