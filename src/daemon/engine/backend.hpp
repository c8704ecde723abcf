#pragma once

#include "../error.hpp"

#include <expected>
#include <span>
#include <string>

// One loaded recognizer. Input is mono float PCM at audio::target_sample_rate.
class TranscriptionBackend {
public:
    virtual ~TranscriptionBackend() = default;
    virtual std::expected<std::string, Error> transcribe(std::span<const float> audio) = 0;
};
