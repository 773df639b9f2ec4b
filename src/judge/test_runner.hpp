#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "files/scratch_pool.hpp"
#include "judge/test_result.hpp"
#include "sandbox/sio2jail_runner.hpp"
#include "utils/cancellation.hpp"

namespace verdict::judge {

struct TestRequest {
    std::string executable;
    std::optional<std::string> checker;
    std::filesystem::path input_path;
    std::filesystem::path output_dir;
    std::string test_name;
    std::string out_extension = ".out";
    std::chrono::seconds timeout{5};
    std::int64_t memory_limit_kb = 1048576;
};

// Services shared by every worker. `sandbox` is null when programs run unsandboxed.
struct TestEnvironment {
    files::ScratchPool& pool;
    const sandbox::Sio2jailRunner* sandbox = nullptr;
    const utils::CancellationToken* cancel = nullptr;
};

std::filesystem::path ReferenceOutputPath(const TestRequest& request);

// Runs the program on one input and judges it against the reference output or the checker.
// Throws JudgeError on harness failures and RunCancelled during shutdown.
TestOutcome RunTest(const TestRequest& request, const TestEnvironment& env);

// Runs the program and stores its output as the reference output of the test.
RunOutcome GenerateOutput(const TestRequest& request, const TestEnvironment& env);

}  // namespace verdict::judge
