#pragma once

#include "../engine/backend.hpp"
#include "../model/model_descriptor.hpp"
#include "platform/process_runner.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

struct SidecarSettings {
    // Probed in order; the first existing file is run.
    std::vector<std::filesystem::path> binary_candidates;
    std::filesystem::path scratch_dir;
    // Bias words for transducer beam search, used when the file exists.
    std::filesystem::path hotwords_file;
    int threads = 4;
    double hotwords_score = 2.0;
    std::string whisper_language = "en";
    std::string whisper_task = "transcribe";
};

std::expected<std::filesystem::path, Error>
    locate_sidecar_binary(const std::vector<std::filesystem::path>& candidates);

// Command line for one offline decode of `wav_path`. --tokens comes first,
// the wav path last.
std::vector<std::string> build_sidecar_args(const ExternalModel& model,
                                            const SidecarSettings& settings,
                                            const std::filesystem::path& wav_path);

// Writes samples as 16 kHz mono 16-bit PCM under a fresh name in `dir`,
// creating the directory if needed.
std::expected<std::filesystem::path, Error>
    write_scratch_wav(const std::filesystem::path& dir, std::span<const float> samples);

// Runs an ONNX model through the sherpa-onnx offline binary. Holds no process
// between calls.
class SidecarBackend : public TranscriptionBackend {
public:
    using LogFn = std::function<void(const std::string&)>;

    SidecarBackend(ExternalModel model, SidecarSettings settings, ProcessRunner& runner,
                   LogFn log = {});

    std::expected<std::string, Error> transcribe(std::span<const float> audio) override;

    const ExternalModel& model() const { return model_; }

private:
    void log(const std::string& msg) const;

    ExternalModel model_;
    SidecarSettings settings_;
    ProcessRunner& runner_;
    LogFn log_;
};
