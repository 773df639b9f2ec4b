#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "utils/cancellation.hpp"

namespace verdict::judge {

struct CompileResult {
    bool ok = false;
    std::string executable_path;
    double compile_time_seconds = 0.0;
    // Compiler diagnostics or the reason compilation could not run.
    std::string message;
};

// Splits a command template shell-style: double quotes group words and backslash escapes
// quotes and backslashes. Throws JudgeError on an unterminated quote or unknown escape.
std::vector<std::string> TokenizeCommand(const std::string& command);

// Builds `source` with `command_template`, where <IN> and <OUT> stand for the source path and
// the executable path (<scratch_dir>/<stem>.o). The compiler is killed after `timeout`.
CompileResult Compile(const std::filesystem::path& source,
                      const std::filesystem::path& scratch_dir,
                      std::chrono::seconds timeout,
                      const std::string& command_template,
                      const utils::CancellationToken* cancel = nullptr);

}  // namespace verdict::judge
