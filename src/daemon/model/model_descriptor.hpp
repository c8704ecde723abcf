#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

enum class ExternalKind { Transducer, WhisperStyle, SenseVoice };

constexpr const char* to_string(ExternalKind kind) {
    switch (kind) {
        case ExternalKind::Transducer: return "transducer";
        case ExternalKind::WhisperStyle: return "whisper";
        case ExternalKind::SenseVoice: return "sense-voice";
    }
    return "unknown";
}

// A single ggml model file run in-process.
struct EmbeddedModel {
    std::filesystem::path path;
};

// An ONNX model directory run through the sidecar binary.
// Transducer: encoder + decoder + joiner. WhisperStyle: encoder + decoder.
// SenseVoice: model only.
struct ExternalModel {
    ExternalKind kind = ExternalKind::Transducer;
    std::filesystem::path tokens;
    std::optional<std::filesystem::path> encoder;
    std::optional<std::filesystem::path> decoder;
    std::optional<std::filesystem::path> joiner;
    std::optional<std::filesystem::path> model;
};

using ModelDescriptor = std::variant<EmbeddedModel, ExternalModel>;

struct ResolvedModel {
    ModelDescriptor descriptor;
    std::string label;
};
