#pragma once

#include "../error.hpp"
#include "../model/model_descriptor.hpp"
#include "backend.hpp"

#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

struct Unloaded {};

struct EmbeddedEngine {
    std::filesystem::path model_path;
    std::unique_ptr<TranscriptionBackend> backend;
};

// External engines hold no process; the sidecar is spawned per request.
struct ExternalEngine {
    ExternalModel model;
    std::unique_ptr<TranscriptionBackend> backend;
};

using EngineState = std::variant<Unloaded, EmbeddedEngine, ExternalEngine>;

// Text together with the label of the engine that produced it.
struct Transcript {
    std::string text;
    std::string model;
};

// Owns the active recognizer and its label behind one mutex. Loads and
// transcriptions are serialized: at most one runs at any time.
class Engine {
public:
    using BackendFactory = std::function<
        std::expected<std::unique_ptr<TranscriptionBackend>, Error>(const ModelDescriptor&)>;

    explicit Engine(BackendFactory factory);

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Resolves the path and loads the result. Returns the new label.
    std::expected<std::string, Error> load(const std::filesystem::path& path);

    // Builds the backend and swaps it in together with the label. On failure
    // the previous engine stays active.
    std::expected<std::string, Error> load(const ResolvedModel& resolved);

    std::expected<std::string, Error> current_label() const;

    std::expected<std::string, Error> transcribe(std::span<const float> audio);

    // Same as transcribe(), with the label read under the same guard.
    std::expected<Transcript, Error> transcribe_labeled(std::span<const float> audio);

    // Runs f on the state while holding the guard.
    template <typename F>
    auto with_active(F&& f) -> std::expected<std::invoke_result_t<F&, EngineState&>, Error> {
        std::unique_lock lock(mutex_, std::defer_lock);
        if (auto locked = acquire(lock); !locked) return std::unexpected(locked.error());
        return f(state_);
    }

private:
    std::expected<void, Error> acquire(std::unique_lock<std::mutex>& lock) const;

    BackendFactory factory_;

    mutable std::mutex mutex_;
    EngineState state_;
    std::string label_ = "None";
};
