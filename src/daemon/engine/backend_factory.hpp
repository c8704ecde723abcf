#pragma once

#include "../sidecar/sidecar_backend.hpp"
#include "../whisper/whisper_backend.hpp"
#include "engine.hpp"

struct BackendSettings {
    WhisperOptions whisper;
    SidecarSettings sidecar;
};

// Embedded descriptors get a WhisperBackend, external ones a SidecarBackend
// that spawns through `runner`.
Engine::BackendFactory make_backend_factory(BackendSettings settings, ProcessRunner& runner,
                                            SidecarBackend::LogFn log = {});

struct Config;

// Thread counts, sidecar locations and scratch/hotwords paths from the config.
BackendSettings make_backend_settings(const Config& config, bool verbose);
