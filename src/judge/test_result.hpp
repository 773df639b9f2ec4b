#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace verdict::judge {

struct ExecutionResult {
    double time_seconds = 0.0;
    // Only sandboxed runs measure memory.
    std::optional<std::int64_t> memory_kilobytes;
};

namespace error {

struct RuntimeError {
    std::string message;
};
struct TimedOut {};
struct InvalidOutput {};
struct MemoryLimitExceeded {};
struct Sio2jailError {
    std::string message;
};
struct IncorrectCheckerFormat {
    std::string message;
};

}  // namespace error

// Why a run could not be judged as a plain pass/fail.
using ExecutionError = std::variant<
    error::RuntimeError,
    error::TimedOut,
    error::InvalidOutput,
    error::MemoryLimitExceeded,
    error::Sio2jailError,
    error::IncorrectCheckerFormat>;

struct RunOutcome {
    ExecutionResult result;
    std::optional<ExecutionError> error;

    bool Ok() const { return !error.has_value(); }
};

namespace verdicts {

struct Correct {
    std::string test_name;
};
struct Incorrect {
    std::string test_name;
    std::string error;
};
struct ProgramError {
    std::string test_name;
    ExecutionError error;
};
struct CheckerError {
    std::string test_name;
    ExecutionError error;
};
struct NoOutputFile {
    std::string test_name;
};

}  // namespace verdicts

using TestResult = std::variant<
    verdicts::Correct,
    verdicts::Incorrect,
    verdicts::ProgramError,
    verdicts::CheckerError,
    verdicts::NoOutputFile>;

struct TestOutcome {
    TestResult verdict;
    ExecutionResult execution;
};

const std::string& TestName(const TestResult& result);
std::string Describe(const ExecutionError& error);
std::string Describe(const TestResult& result);
std::string FormatExecution(const ExecutionResult& execution);

}  // namespace verdict::judge
