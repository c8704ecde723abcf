#pragma once

#include "../engine/backend.hpp"

#include <filesystem>
#include <memory>
#include <string>

struct whisper_context;

struct WhisperOptions {
    int threads = 4;
    std::string language; // empty keeps the model default
    bool verbose = false;
};

// In-process whisper.cpp recognizer. The context is shared read-only; each
// call decodes in its own whisper_state.
class WhisperBackend : public TranscriptionBackend {
    struct Token {
        explicit Token() = default;
    };

public:
    static std::expected<std::unique_ptr<WhisperBackend>, Error>
        create(const std::filesystem::path& model_path, WhisperOptions options);

    // Reachable only through create()
    WhisperBackend(Token, whisper_context* ctx, WhisperOptions options);
    ~WhisperBackend() override;

    WhisperBackend(const WhisperBackend&) = delete;
    WhisperBackend& operator=(const WhisperBackend&) = delete;

    std::expected<std::string, Error> transcribe(std::span<const float> audio) override;

private:
    whisper_context* ctx_;
    WhisperOptions options_;
};
