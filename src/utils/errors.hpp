#pragma once

#include <stdexcept>
#include <string>

namespace verdict {

// Harness-internal failure: the affected test is aborted instead of being scored.
class JudgeError : public std::runtime_error {
public:
    explicit JudgeError(const std::string& message)
        : std::runtime_error(message) {}
};

// Thrown out of a run when the harness is shutting down; no verdict is reported.
class RunCancelled : public std::runtime_error {
public:
    RunCancelled()
        : std::runtime_error("run cancelled") {}
};

}  // namespace verdict
