#include "backend_factory.hpp"

#include "../config.hpp"
#include "platform/platform_paths.hpp"

#include <filesystem>

Engine::BackendFactory make_backend_factory(BackendSettings settings, ProcessRunner& runner,
                                            SidecarBackend::LogFn log) {
    return [settings = std::move(settings), &runner, log = std::move(log)](const ModelDescriptor& descriptor)
               -> std::expected<std::unique_ptr<TranscriptionBackend>, Error> {
        if (auto* embedded = std::get_if<EmbeddedModel>(&descriptor)) {
            auto backend = WhisperBackend::create(embedded->path, settings.whisper);
            if (!backend) return std::unexpected(backend.error());
            return std::unique_ptr<TranscriptionBackend>(std::move(*backend));
        }
        const auto& external = std::get<ExternalModel>(descriptor);
        return std::make_unique<SidecarBackend>(external, settings.sidecar, runner, log);
    };
}

BackendSettings make_backend_settings(const Config& config, bool verbose) {
    namespace fs = std::filesystem;

    BackendSettings s;
    s.whisper.threads = config.whisper.threads;
    s.whisper.language = config.whisper.language;
    s.whisper.verbose = verbose;

    auto resource_dir = !config.sidecar.resource_dir.empty()
        ? fs::path(config.sidecar.resource_dir)
        : fs::path(platform::resource_dir());

    // Packaged location first, then the development tree
    if (!resource_dir.empty()) {
        s.sidecar.binary_candidates.push_back(resource_dir / "bin" / config.sidecar.binary);
    }
    std::error_code ec;
    auto cwd = fs::current_path(ec);
    if (!ec) {
        s.sidecar.binary_candidates.push_back(cwd / "bin" / config.sidecar.binary);
    }

    s.sidecar.scratch_dir = config.paths.resolved_cache_dir();
    s.sidecar.hotwords_file = config.paths.hotwords_file();
    s.sidecar.threads = config.sidecar.threads;
    s.sidecar.hotwords_score = config.sidecar.hotwords_score;
    s.sidecar.whisper_language = config.sidecar.language;
    s.sidecar.whisper_task = config.sidecar.task;
    return s;
}
