#include "whisper_backend.hpp"

#include "hallucination_filter.hpp"

#include <format>
#include <whisper.h>

namespace {

void discard_log(enum ggml_log_level, const char*, void*) {}

struct StateDeleter {
    void operator()(whisper_state* s) const { whisper_free_state(s); }
};

} // namespace

std::expected<std::unique_ptr<WhisperBackend>, Error>
WhisperBackend::create(const std::filesystem::path& model_path, WhisperOptions options) {
    // nullptr restores whisper.cpp's own stderr logger
    whisper_log_set(options.verbose ? nullptr : discard_log, nullptr);

    whisper_context_params cparams = whisper_context_default_params();
    whisper_context* ctx = whisper_init_from_file_with_params(model_path.c_str(), cparams);
    if (!ctx) {
        return std::unexpected(Error{ErrorKind::ModelInit,
            std::format("Failed to load Whisper model: {}", model_path.string())});
    }
    return std::make_unique<WhisperBackend>(Token{}, ctx, std::move(options));
}

WhisperBackend::WhisperBackend(Token, whisper_context* ctx, WhisperOptions options)
    : ctx_(ctx), options_(std::move(options)) {}

WhisperBackend::~WhisperBackend() {
    if (ctx_) whisper_free(ctx_);
}

std::expected<std::string, Error> WhisperBackend::transcribe(std::span<const float> audio) {
    std::unique_ptr<whisper_state, StateDeleter> state(whisper_init_state(ctx_));
    if (!state) {
        return std::unexpected(Error{ErrorKind::Session, "Failed to create Whisper state"});
    }

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.greedy.best_of = 1;
    params.n_threads = options_.threads;
    params.print_special = false;
    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    if (!options_.language.empty()) {
        params.language = options_.language.c_str();
    }

    int rc = whisper_full_with_state(ctx_, state.get(), params, audio.data(),
                                     static_cast<int>(audio.size()));
    if (rc != 0) {
        return std::unexpected(Error{ErrorKind::Decode,
            std::format("Whisper error: whisper_full returned {}", rc)});
    }

    int n_segments = whisper_full_n_segments_from_state(state.get());
    if (n_segments < 0) {
        return std::unexpected(Error{ErrorKind::Decode,
            std::format("Error getting segments: {}", n_segments)});
    }

    std::string text;
    for (int i = 0; i < n_segments; ++i) {
        // A segment without text contributes nothing
        const char* segment = whisper_full_get_segment_text_from_state(state.get(), i);
        if (segment) text += segment;
    }

    return filter_hallucinations(text);
}
