#include "hallucination_filter.hpp"

#include "../util/text.hpp"

std::string filter_hallucinations(std::string_view raw) {
    std::string out = text::trim(raw);
    for (auto marker : hallucination_markers) {
        size_t pos = 0;
        while ((pos = out.find(marker, pos)) != std::string::npos) {
            out.erase(pos, marker.size());
        }
    }
    return text::trim(out);
}
