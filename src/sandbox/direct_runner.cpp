#include "sandbox/direct_runner.hpp"

#include <optional>

#include <boost/process.hpp>

#include "sandbox/child_wait.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace verdict::sandbox {
namespace bp = boost::process;

judge::RunOutcome DirectRunner::Run(const std::string& executable,
                                    const files::FileHandle& stdin_file,
                                    const files::FileHandle& stdout_file,
                                    std::chrono::seconds timeout,
                                    const utils::CancellationToken* cancel,
                                    const std::string& role) {
    const auto started = std::chrono::steady_clock::now();
    std::optional<bp::child> child;
    try {
        child.emplace(
            bp::exe = executable,
            bp::std_in < stdin_file.get(),
            bp::std_out > stdout_file.get());
    } catch (const bp::process_error& ex) {
        throw JudgeError("Failed to run " + executable + ": " + ex.what());
    }

    const auto exit = WaitForChild(*child, timeout, started, cancel);
    judge::RunOutcome outcome{};
    outcome.result.time_seconds = exit.elapsed_seconds;
    outcome.error = ClassifyExit(exit, role);
    if (exit.kind == ExitKind::kTimedOut) {
        utils::Log(utils::LogLevel::kDebug, "run",
                   executable + " killed after " + std::to_string(timeout.count()) + "s");
    }
    return outcome;
}

}  // namespace verdict::sandbox
