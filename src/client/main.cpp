#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [--socket PATH] <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  load <path>                          Load a model file or directory");
    std::println(stderr, "  model                                Show the active model");
    std::println(stderr, "  transcribe <wav> [--title T] [--no-save]");
    std::println(stderr, "                                       Transcribe a 16kHz WAV file");
    std::println(stderr, "  history [--limit N]                  Show transcription history");
    std::println(stderr, "  delete <id>                          Delete a history entry");
    std::println(stderr, "  stats                                Show dashboard statistics");
    std::println(stderr, "  vocabulary [--set WORD...]           Show or replace hotwords");
    std::println(stderr, "  download <url> <name>                Download a model file");
    std::println(stderr, "  status                               Show daemon status");
}

// Relative paths are resolved here since the daemon runs with another cwd.
static std::string absolute(const std::string& p) {
    std::error_code ec;
    auto abs = std::filesystem::absolute(p, ec);
    return ec ? p : abs.string();
}

int main(int argc, char* argv[]) {
    int first = 1;
    std::string sock_path = platform::ipc_endpoint();
    if (argc > 2 && std::string(argv[1]) == "--socket") {
        sock_path = argv[2];
        first = 3;
    }

    if (argc <= first) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[first];
    std::vector<std::string> positional;
    std::string title;
    bool save = true;
    bool set_words = false;
    int limit = 10;

    // Parse optional args
    for (int i = first + 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--title" && i + 1 < argc) {
            title = argv[++i];
        } else if (arg == "--limit" && i + 1 < argc) {
            limit = std::atoi(argv[++i]);
        } else if (arg == "--no-save") {
            save = false;
        } else if (arg == "--set") {
            set_words = true;
        } else {
            positional.push_back(arg);
        }
    }

    auto need = [&](size_t n) {
        if (positional.size() >= n) return true;
        std::println(stderr, "{}: missing argument", command);
        usage(argv[0]);
        return false;
    };

    // Build command JSON
    json cmd;
    bool long_running = false;
    if (command == "load") {
        if (!need(1)) return 1;
        cmd = {{"cmd", "load"}, {"path", absolute(positional[0])}};
        long_running = true;
    } else if (command == "model") {
        cmd = {{"cmd", "model"}};
        long_running = true;
    } else if (command == "transcribe") {
        if (!need(1)) return 1;
        cmd = {{"cmd", "transcribe"}, {"path", absolute(positional[0])}, {"save", save}};
        if (!title.empty()) cmd["title"] = title;
        long_running = true;
    } else if (command == "history") {
        cmd = {{"cmd", "history"}, {"limit", limit}};
    } else if (command == "delete") {
        if (!need(1)) return 1;
        cmd = {{"cmd", "delete"}, {"id", std::atoll(positional[0].c_str())}};
    } else if (command == "stats") {
        cmd = {{"cmd", "stats"}};
    } else if (command == "vocabulary") {
        cmd = {{"cmd", "vocabulary"}};
        if (set_words) cmd["words"] = positional;
    } else if (command == "download") {
        if (!need(2)) return 1;
        cmd = {{"cmd", "download"}, {"url", positional[0]}, {"name", positional[1]}};
        long_running = true;
    } else if (command == "status") {
        cmd = {{"cmd", "status"}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    // Connect and send
    UnixSocketClient client;
    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is vox-dispatchd running?");
        return 1;
    }

    // Worker commands wait behind model loads and transcriptions
    json response;
    if (!client.request(cmd, response, long_running ? -1 : 30000)) {
        std::println(stderr, "No response from daemon");
        return 1;
    }

    // Display response
    auto status = response.value("status", "");

    if (status == "error") {
        if (response.contains("kind")) {
            std::println(stderr, "Error ({}): {}", response["kind"].get<std::string>(),
                         response.value("message", "unknown error"));
        } else {
            std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        }
        return 1;
    }

    if (status != "ok") {
        std::println("{}", response.dump(2));
        return 0;
    }

    if (command == "load" || command == "model") {
        std::println("Model: {}", response.value("model", "None"));
    } else if (command == "transcribe") {
        std::println("{}", response.value("text", ""));
        if (response.contains("id")) {
            std::println(stderr, "Saved as #{} ({:.1f}s audio, {:.1f}s processing)",
                         response["id"].get<int64_t>(), response.value("duration", 0.0),
                         response.value("processing_time", 0.0));
        }
    } else if (command == "history") {
        for (auto& entry : response["entries"]) {
            std::println("#{} [{}] {}", entry.value("id", int64_t{0}),
                         entry.value("timestamp", ""), entry.value("text", ""));
            auto t = entry.value("title", "");
            if (!t.empty()) std::println("  Title: {}", t);
            std::println("  Model: {}  Duration: {:.1f}s", entry.value("model", ""),
                         entry.value("duration", 0.0));
        }
    } else if (command == "stats") {
        std::println("Words per minute: {}", response.value("wpm", uint64_t{0}));
        std::println("Words this week:  {}", response.value("words_this_week", uint64_t{0}));
        std::println("Apps used:        {}", response.value("apps_used", uint64_t{0}));
        std::println("Time saved:       {}", response.value("saved_time", ""));
    } else if (command == "vocabulary") {
        for (auto& w : response["words"]) {
            std::println("{}", w.get<std::string>());
        }
    } else if (command == "download") {
        std::println("{}", response.value("path", ""));
    } else if (command == "status") {
        std::println("Jobs: {}", response.value("jobs", 0));
        for (auto& d : response["downloads"]) {
            std::println("Downloading {}: {}%", d.value("filename", ""), d.value("progress", 0));
        }
    } else {
        std::println("OK");
    }

    return 0;
}
