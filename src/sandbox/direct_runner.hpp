#pragma once

#include <chrono>
#include <string>

#include "files/temp_file.hpp"
#include "judge/test_result.hpp"
#include "utils/cancellation.hpp"

namespace verdict::sandbox {

// Runs a program with no resource accounting; memory is never measured. `role` names the
// process in error messages.
class DirectRunner {
public:
    static judge::RunOutcome Run(const std::string& executable,
                                 const files::FileHandle& stdin_file,
                                 const files::FileHandle& stdout_file,
                                 std::chrono::seconds timeout,
                                 const utils::CancellationToken* cancel = nullptr,
                                 const std::string& role = "program");
};

}  // namespace verdict::sandbox
