#pragma once

#include <array>
#include <string>
#include <string_view>

// Markers whisper emits for silence or background noise. Matched literally
// and case-sensitively.
inline constexpr std::array<std::string_view, 5> hallucination_markers = {
    "[BLANK_AUDIO]",
    "[silence]",
    "(music)",
    "[MUSIC]",
    "(silence)",
};

// Trims, removes every marker occurrence, trims again. Spacing around a
// removed marker is left as is.
std::string filter_hallucinations(std::string_view raw);
