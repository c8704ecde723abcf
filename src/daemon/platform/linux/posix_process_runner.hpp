#pragma once

#include "platform/process_runner.hpp"

// fork/exec with stdin on /dev/null and stdout/stderr drained through poll().
// The child runs in its own session so it never attaches to our terminal.
class PosixProcessRunner : public ProcessRunner {
public:
    std::expected<ProcessOutput, Error>
        run(const std::filesystem::path& program, const std::vector<std::string>& args) override;
};
