#include "model_resolver.hpp"

#include <format>

namespace fs = std::filesystem;

namespace {

std::optional<fs::path> pick_component(const fs::path& dir, const std::string& stem) {
    std::error_code ec;
    auto quantized = dir / (stem + ".int8.onnx");
    if (fs::is_regular_file(quantized, ec)) return quantized;
    auto standard = dir / (stem + ".onnx");
    if (fs::is_regular_file(standard, ec)) return standard;
    return std::nullopt;
}

std::string label_for(const fs::path& path) {
    // Trailing separators would leave an empty filename
    auto p = path;
    if (!p.has_filename() && p.has_parent_path()) p = p.parent_path();
    return p.filename().string();
}

std::expected<ResolvedModel, Error> resolve_directory(const fs::path& dir) {
    std::error_code ec;
    auto tokens = dir / "tokens.txt";
    if (!fs::exists(tokens, ec)) {
        return std::unexpected(Error{ErrorKind::MissingTokens,
            std::format("Missing tokens.txt in {}", dir.string())});
    }

    ExternalModel model;
    model.tokens = tokens;

    auto sense_voice = dir / "model.int8.onnx";
    if (fs::exists(sense_voice, ec)) {
        model.kind = ExternalKind::SenseVoice;
        model.model = sense_voice;
        return ResolvedModel{model, label_for(dir)};
    }

    model.encoder = pick_component(dir, "encoder");
    model.decoder = pick_component(dir, "decoder");
    model.joiner = pick_component(dir, "joiner");

    if (!model.encoder || !model.decoder) {
        return std::unexpected(Error{ErrorKind::MissingComponent,
            "Missing model files: need either 'model.int8.onnx' (SenseVoice) or "
            "'encoder/decoder' as '*.int8.onnx' or '*.onnx' (Transducer/Whisper)"});
    }

    model.kind = model.joiner ? ExternalKind::Transducer : ExternalKind::WhisperStyle;
    return ResolvedModel{model, label_for(dir)};
}

} // namespace

std::expected<ResolvedModel, Error> resolve_model(const fs::path& path) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return resolve_directory(path);
    }
    if (fs::exists(path, ec)) {
        return ResolvedModel{EmbeddedModel{path}, label_for(path)};
    }
    return std::unexpected(Error{ErrorKind::ModelNotFound,
        std::format("Model path does not exist: {}", path.string())});
}
