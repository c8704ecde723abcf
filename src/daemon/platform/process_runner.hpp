#pragma once

#include "../error.hpp"

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

struct ProcessOutput {
    int exit_code = -1;   // -1 when the child did not exit normally
    int term_signal = 0;  // signal number when killed
    std::string stdout_text;
    std::string stderr_text;

    bool success() const { return term_signal == 0 && exit_code == 0; }
};

// Runs a program to completion with both output streams captured.
// Fails only when the child cannot be started or waited for.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;
    virtual std::expected<ProcessOutput, Error>
        run(const std::filesystem::path& program, const std::vector<std::string>& args) = 0;
};
