#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <boost/process.hpp>

#include "judge/test_result.hpp"
#include "utils/cancellation.hpp"

namespace verdict::sandbox {

enum class ExitKind {
    kExited,
    kSignaled,
    kTimedOut
};

struct ChildExit {
    ExitKind kind = ExitKind::kExited;
    // Exit status for kExited, signal number for kSignaled.
    int code = 0;
    bool core_dumped = false;
    double elapsed_seconds = 0.0;
};

// Waits until `child` exits or `timeout` (counted from `started`) passes; a late child is killed
// and reaped. Throws RunCancelled when the token fires, including shortly after the child died of
// SIGINT. A SIGINT death with no shutdown in progress is reported like any other signal.
ChildExit WaitForChild(boost::process::child& child,
                       std::chrono::seconds timeout,
                       std::chrono::steady_clock::time_point started,
                       const utils::CancellationToken* cancel);

std::string DescribeSignal(int signal, bool core_dumped);

// nullopt for a clean exit, RuntimeError for a signal or non-zero code. `who` names the
// process in the message ("program", "checker").
std::optional<judge::ExecutionError> ClassifyExit(const ChildExit& exit, const std::string& who);

}  // namespace verdict::sandbox
