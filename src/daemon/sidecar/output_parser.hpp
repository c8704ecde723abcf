#pragma once

#include <optional>
#include <string>
#include <string_view>

// Returns the "text" field of the first line in `stream` that parses as a
// JSON object carrying a string "text" member.
std::optional<std::string> extract_structured_text(std::string_view stream);

// Result recovery for one sidecar run: stderr is probed first, then stdout,
// then trimmed stdout is returned verbatim.
std::string recover_transcript(std::string_view stdout_text, std::string_view stderr_text);
