#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include "judge/test_result.hpp"
#include "utils/cancellation.hpp"

namespace verdict::judge {

// Interprets a checker's answer: "C..." accepts, "I..." rejects with the text from the third
// character on as the explanation, anything else is a protocol violation.
TestResult InterpretCheckerOutput(const std::string& test_name, const std::string& checker_output);

// Feeds "<input>\n<output>" to the checker on stdin and judges by its stdout. Failures of the
// checker itself (crash, non-zero exit, timeout, bad format) become CheckerError, never Incorrect.
TestResult Verify(const std::string& test_name,
                  const std::string& checker_path,
                  const std::string& program_input,
                  const std::string& program_output,
                  const std::filesystem::path& scratch_in,
                  const std::filesystem::path& scratch_out,
                  std::chrono::seconds timeout,
                  const utils::CancellationToken* cancel = nullptr);

}  // namespace verdict::judge
