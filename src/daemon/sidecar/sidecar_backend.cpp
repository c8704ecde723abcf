#include "sidecar_backend.hpp"

#include "../audio/wav_decoder.hpp"
#include "../audio/wav_encoder.hpp"
#include "output_parser.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <print>
#include <unistd.h>

namespace fs = std::filesystem;

std::expected<fs::path, Error> locate_sidecar_binary(const std::vector<fs::path>& candidates) {
    std::error_code ec;
    for (const auto& candidate : candidates) {
        if (fs::exists(candidate, ec)) return candidate;
    }

    std::string searched;
    for (const auto& c : candidates) {
        if (!searched.empty()) searched += ", ";
        searched += c.string();
    }
    return std::unexpected(Error{ErrorKind::BinaryNotFound,
        std::format("Sidecar binary not found (searched: {})", searched)});
}

std::vector<std::string> build_sidecar_args(const ExternalModel& model,
                                            const SidecarSettings& settings,
                                            const fs::path& wav_path) {
    std::vector<std::string> args;
    args.push_back("--tokens=" + model.tokens.string());

    switch (model.kind) {
        case ExternalKind::SenseVoice:
            if (model.model) {
                args.push_back("--sense-voice-model=" + model.model->string());
                args.push_back("--model-type=sense-voice");
            }
            break;
        case ExternalKind::Transducer:
            if (model.encoder && model.decoder && model.joiner) {
                args.push_back("--encoder=" + model.encoder->string());
                args.push_back("--decoder=" + model.decoder->string());
                args.push_back("--joiner=" + model.joiner->string());

                std::error_code ec;
                if (!settings.hotwords_file.empty() && fs::exists(settings.hotwords_file, ec)) {
                    args.push_back("--hotwords-file=" + settings.hotwords_file.string());
                    args.push_back(std::format("--hotwords-score={:.1f}", settings.hotwords_score));
                    args.push_back("--decoding-method=modified_beam_search");
                } else {
                    args.push_back("--decoding-method=greedy_search");
                }
            }
            break;
        case ExternalKind::WhisperStyle:
            if (model.encoder && model.decoder) {
                args.push_back("--whisper-encoder=" + model.encoder->string());
                args.push_back("--whisper-decoder=" + model.decoder->string());
                args.push_back("--whisper-language=" + settings.whisper_language);
                args.push_back("--whisper-task=" + settings.whisper_task);
                args.push_back("--model-type=whisper");
            }
            break;
    }

    args.push_back(std::format("--num-threads={}", settings.threads));
    args.push_back(wav_path.string());
    return args;
}

std::expected<fs::path, Error> write_scratch_wav(const fs::path& dir, std::span<const float> samples) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return std::unexpected(Error{ErrorKind::Io,
            std::format("Failed to create scratch dir {}: {}", dir.string(), ec.message())});
    }

    // mkstemps needs a mutable template; the suffix keeps the .wav extension
    std::string tmpl = (dir / "temp_rec_XXXXXX.wav").string();
    int fd = ::mkstemps(tmpl.data(), 4);
    if (fd < 0) {
        return std::unexpected(Error{ErrorKind::Io,
            std::format("Failed to create WAV file in {}: {}", dir.string(), std::strerror(errno))});
    }

    auto bytes = wav::encode(samples, audio::target_sample_rate);
    size_t written = 0;
    while (written < bytes.size()) {
        ssize_t n = ::write(fd, bytes.data() + written, bytes.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            auto err = Error{ErrorKind::Io,
                std::format("Failed to write WAV file {}: {}", tmpl, std::strerror(errno))};
            ::close(fd);
            fs::remove(tmpl, ec);
            return std::unexpected(err);
        }
        written += static_cast<size_t>(n);
    }

    if (::close(fd) < 0) {
        auto err = Error{ErrorKind::Io,
            std::format("Failed to finalize WAV file {}: {}", tmpl, std::strerror(errno))};
        fs::remove(tmpl, ec);
        return std::unexpected(err);
    }
    return fs::path(tmpl);
}

SidecarBackend::SidecarBackend(ExternalModel model, SidecarSettings settings,
                               ProcessRunner& runner, LogFn log)
    : model_(std::move(model)), settings_(std::move(settings)),
      runner_(runner), log_(std::move(log)) {}

std::expected<std::string, Error> SidecarBackend::transcribe(std::span<const float> audio) {
    auto wav_path = write_scratch_wav(settings_.scratch_dir, audio);
    if (!wav_path) return std::unexpected(wav_path.error());

    auto binary = locate_sidecar_binary(settings_.binary_candidates);
    if (!binary) {
        std::error_code ec;
        fs::remove(*wav_path, ec);
        return std::unexpected(binary.error());
    }

    auto args = build_sidecar_args(model_, settings_, *wav_path);
    log(std::format("Spawning sidecar {} ({} model)", binary->string(), to_string(model_.kind)));

    auto output = runner_.run(*binary, args);
    if (!output) {
        std::println(stderr, "sidecar: keeping scratch wav for debugging: {}", wav_path->string());
        return std::unexpected(output.error());
    }

    log(std::format("Sidecar exit code: {}", output->exit_code));
    log("Sidecar raw stderr: " + output->stderr_text);
    log("Sidecar raw stdout: " + output->stdout_text);

    if (!output->success()) {
        std::println(stderr, "sidecar: keeping scratch wav for debugging: {}", wav_path->string());
        std::string code = output->term_signal != 0
            ? std::format("signal {}", output->term_signal)
            : std::to_string(output->exit_code);
        return std::unexpected(Error{ErrorKind::ProcessExit,
            std::format("Sidecar exit code: {}. Stderr: {}. Stdout: {}",
                        code, output->stderr_text, output->stdout_text)});
    }

    std::error_code ec;
    fs::remove(*wav_path, ec);
    if (ec) {
        std::println(stderr, "sidecar: failed to remove {}: {}", wav_path->string(), ec.message());
    }

    return recover_transcript(output->stdout_text, output->stderr_text);
}

void SidecarBackend::log(const std::string& msg) const {
    if (log_) log_(msg);
}
