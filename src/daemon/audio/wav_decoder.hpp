#pragma once

#include "../error.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <vector>

namespace audio {

// Both backends consume mono float samples at this rate. No resampling is done.
constexpr uint32_t target_sample_rate = 16000;

using AudioBuffer = std::vector<float>;

struct WavFormat {
    uint16_t format_tag = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t block_align = 0;
    uint16_t bits_per_sample = 0;
    bool is_float = false;
};

// Decodes a WAV byte stream into mono 16 kHz float samples.
// Integer PCM is scaled by 2^(bits-1), float PCM passes through, stereo is
// averaged pairwise, and any non-finite value leaves as 0.0.
std::expected<AudioBuffer, Error> normalize(std::span<const uint8_t> bytes);

// Header-only parse, exposed for diagnostics and tests.
std::expected<WavFormat, Error> read_format(std::span<const uint8_t> bytes);

} // namespace audio
