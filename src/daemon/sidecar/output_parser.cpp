#include "output_parser.hpp"

#include "../util/text.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::optional<std::string> extract_structured_text(std::string_view stream) {
    size_t pos = 0;
    while (pos <= stream.size()) {
        auto nl = stream.find('\n', pos);
        auto line = stream.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

        // parse() without exceptions yields a discarded value on bad input
        auto j = json::parse(line, nullptr, false);
        if (j.is_object()) {
            auto it = j.find("text");
            if (it != j.end() && it->is_string()) {
                return it->get<std::string>();
            }
        }

        if (nl == std::string_view::npos) break;
        pos = nl + 1;
    }
    return std::nullopt;
}

std::string recover_transcript(std::string_view stdout_text, std::string_view stderr_text) {
    if (auto found = extract_structured_text(stderr_text)) return *found;
    if (auto found = extract_structured_text(stdout_text)) return *found;
    return text::trim(stdout_text);
}
