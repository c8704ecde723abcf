#include "wav_decoder.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <format>

namespace audio {

namespace {

constexpr uint16_t format_pcm = 1;
constexpr uint16_t format_ieee_float = 3;
constexpr uint16_t format_extensible = 0xFFFE;

uint16_t read_u16(const uint8_t* p) {
    uint16_t v;
    std::memcpy(&v, p, 2);
    return v;
}

uint32_t read_u32(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, 4);
    return v;
}

bool tag_is(const uint8_t* p, const char* tag) {
    return std::memcmp(p, tag, 4) == 0;
}

Error format_error(std::string msg) {
    return Error{ErrorKind::Format, "WavReader error: " + std::move(msg)};
}

struct Chunks {
    WavFormat format;
    bool have_format = false;
    std::span<const uint8_t> data;
    bool have_data = false;
};

std::expected<Chunks, Error> scan_chunks(std::span<const uint8_t> bytes) {
    if (bytes.size() < 12 || !tag_is(bytes.data(), "RIFF") || !tag_is(bytes.data() + 8, "WAVE")) {
        return std::unexpected(format_error("no RIFF/WAVE header"));
    }

    Chunks out;
    size_t pos = 12;
    while (pos + 8 <= bytes.size() && !out.have_data) {
        const uint8_t* hdr = bytes.data() + pos;
        uint32_t chunk_size = read_u32(hdr + 4);
        size_t body = pos + 8;
        size_t remaining = bytes.size() - body;

        if (tag_is(hdr, "fmt ")) {
            if (chunk_size < 16 || remaining < 16) {
                return std::unexpected(format_error("fmt chunk too short"));
            }
            const uint8_t* f = bytes.data() + body;
            auto& fmt = out.format;
            fmt.format_tag = read_u16(f);
            fmt.channels = read_u16(f + 2);
            fmt.sample_rate = read_u32(f + 4);
            fmt.block_align = read_u16(f + 12);
            fmt.bits_per_sample = read_u16(f + 14);

            uint16_t effective_tag = fmt.format_tag;
            if (fmt.format_tag == format_extensible) {
                // WAVEFORMATEXTENSIBLE: sub-format GUID starts at offset 24
                if (chunk_size < 40 || remaining < 40) {
                    return std::unexpected(format_error("extensible fmt chunk too short"));
                }
                effective_tag = read_u16(f + 24);
            }

            if (effective_tag == format_pcm) {
                fmt.is_float = false;
            } else if (effective_tag == format_ieee_float) {
                fmt.is_float = true;
            } else {
                return std::unexpected(format_error(
                    std::format("unsupported format tag {}", effective_tag)));
            }
            out.have_format = true;
        } else if (tag_is(hdr, "data")) {
            if (!out.have_format) {
                return std::unexpected(format_error("data chunk before fmt chunk"));
            }
            // A declared size past the end of the buffer is clipped to what is present.
            size_t len = std::min<size_t>(chunk_size, remaining);
            out.data = bytes.subspan(body, len);
            out.have_data = true;
            break;
        }

        // Chunks are word aligned
        size_t advance = 8 + static_cast<size_t>(chunk_size) + (chunk_size & 1);
        if (advance > bytes.size() - pos) break;
        pos += advance;
    }

    if (!out.have_format) return std::unexpected(format_error("missing fmt chunk"));
    if (!out.have_data) return std::unexpected(format_error("missing data chunk"));
    return out;
}

std::expected<void, Error> validate_encoding(const WavFormat& fmt) {
    if (fmt.is_float) {
        if (fmt.bits_per_sample != 32) {
            return std::unexpected(format_error(
                std::format("unsupported float bit depth {}", fmt.bits_per_sample)));
        }
    } else {
        switch (fmt.bits_per_sample) {
            case 8: case 16: case 24: case 32: break;
            default:
                return std::unexpected(format_error(
                    std::format("unsupported integer bit depth {}", fmt.bits_per_sample)));
        }
    }
    return {};
}

// Decodes the whole sample starting at offset.
float decode_sample(std::span<const uint8_t> data, size_t offset, const WavFormat& fmt) {
    const uint8_t* p = data.data() + offset;

    if (fmt.is_float) {
        float v;
        std::memcpy(&v, p, 4);
        return v;
    }

    int32_t raw = 0;
    switch (fmt.bits_per_sample) {
        case 8:
            // 8-bit WAV is unsigned with a 128 bias
            raw = static_cast<int32_t>(p[0]) - 128;
            break;
        case 16:
            raw = static_cast<int16_t>(read_u16(p));
            break;
        case 24: {
            uint32_t u = static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
                         (static_cast<uint32_t>(p[2]) << 16);
            if (u & 0x800000u) u |= 0xFF000000u;
            raw = static_cast<int32_t>(u);
            break;
        }
        case 32:
            raw = static_cast<int32_t>(read_u32(p));
            break;
    }

    float max_val = static_cast<float>(int64_t(1) << (fmt.bits_per_sample - 1));
    return static_cast<float>(raw) / max_val;
}

float finite_or_zero(float v) {
    return std::isfinite(v) ? v : 0.0f;
}

} // namespace

std::expected<WavFormat, Error> read_format(std::span<const uint8_t> bytes) {
    auto chunks = scan_chunks(bytes);
    if (!chunks) return std::unexpected(chunks.error());
    return chunks->format;
}

std::expected<AudioBuffer, Error> normalize(std::span<const uint8_t> bytes) {
    auto chunks = scan_chunks(bytes);
    if (!chunks) return std::unexpected(chunks.error());

    const auto& fmt = chunks->format;
    if (auto ok = validate_encoding(fmt); !ok) return std::unexpected(ok.error());

    if (fmt.sample_rate != target_sample_rate) {
        return std::unexpected(Error{ErrorKind::SampleRate,
            std::format("WAV file must be 16kHz, found {}", fmt.sample_rate)});
    }

    if (fmt.channels != 1 && fmt.channels != 2) {
        return std::unexpected(Error{ErrorKind::Channel,
            std::format("Unsupported channel count: {}", fmt.channels)});
    }

    auto data = chunks->data;
    size_t width = fmt.bits_per_sample / 8;
    // Only whole samples count; a trailing byte fragment is ignored.
    size_t n_samples = data.size() / width;

    AudioBuffer samples;
    if (fmt.channels == 1) {
        samples.reserve(n_samples);
        for (size_t i = 0; i < n_samples; ++i) {
            samples.push_back(finite_or_zero(decode_sample(data, i * width, fmt)));
        }
        return samples;
    }

    // Stereo: average strict pairs, an odd trailing sample is dropped
    size_t n_frames = n_samples / 2;
    samples.reserve(n_frames);
    for (size_t i = 0; i < n_frames; ++i) {
        float left = decode_sample(data, (2 * i) * width, fmt);
        float right = decode_sample(data, (2 * i + 1) * width, fmt);
        samples.push_back(finite_or_zero((left + right) / 2.0f));
    }
    return samples;
}

} // namespace audio
