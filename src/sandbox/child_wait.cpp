#include "sandbox/child_wait.hpp"

#include <cerrno>
#include <cstring>
#include <signal.h>
#include <sys/wait.h>
#include <thread>

#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace verdict::sandbox {
namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(2);
// Longer than the CLI's signal watcher interval, so a Ctrl+C reaches the token first.
constexpr auto kInterruptGrace = std::chrono::milliseconds(200);

void KillAndReap(boost::process::child& child) {
    const pid_t pid = child.id();
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    child.detach();
}

// A terminal Ctrl+C reaches the child and the harness together; only the token tells the two
// cases apart.
bool AwaitShutdown(const utils::CancellationToken* cancel) {
    if (cancel == nullptr) {
        return false;
    }
    const auto deadline = std::chrono::steady_clock::now() + kInterruptGrace;
    while (!cancel->IsCancelled()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
    return true;
}

double SecondsSince(std::chrono::steady_clock::time_point started) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
}

}  // namespace

ChildExit WaitForChild(boost::process::child& child,
                       std::chrono::seconds timeout,
                       std::chrono::steady_clock::time_point started,
                       const utils::CancellationToken* cancel) {
    const pid_t pid = child.id();
    const auto deadline = started + timeout;
    int status = 0;
    while (true) {
        const auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            break;
        }
        if (waited < 0 && errno != EINTR) {
            const std::string reason = std::strerror(errno);
            KillAndReap(child);
            throw JudgeError("waitpid() failed: " + reason);
        }
        if (utils::IsCancelled(cancel)) {
            KillAndReap(child);
            throw RunCancelled();
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            KillAndReap(child);
            ChildExit exit{};
            exit.kind = ExitKind::kTimedOut;
            exit.elapsed_seconds = static_cast<double>(timeout.count());
            return exit;
        }
        std::this_thread::sleep_for(kPollInterval);
    }

    ChildExit exit{};
    exit.elapsed_seconds = SecondsSince(started);
    child.detach();
    if (WIFSIGNALED(status)) {
        if (WTERMSIG(status) == SIGINT && AwaitShutdown(cancel)) {
            utils::Log(utils::LogLevel::kDebug, "run", "child interrupted, dropping its result");
            throw RunCancelled();
        }
        exit.kind = ExitKind::kSignaled;
        exit.code = WTERMSIG(status);
#ifdef WCOREDUMP
        exit.core_dumped = WCOREDUMP(status);
#endif
    } else {
        exit.kind = ExitKind::kExited;
        exit.code = WEXITSTATUS(status);
    }
    return exit;
}

std::string DescribeSignal(int signal, bool core_dumped) {
    std::string description = "signal: " + std::to_string(signal);
    const char* name = ::strsignal(signal);
    if (name != nullptr) {
        description += " (" + std::string(name) + ")";
    }
    if (core_dumped) {
        description += " (core dumped)";
    }
    return description;
}

std::optional<judge::ExecutionError> ClassifyExit(const ChildExit& exit, const std::string& who) {
    switch (exit.kind) {
        case ExitKind::kTimedOut:
            return judge::ExecutionError{judge::error::TimedOut{}};
        case ExitKind::kSignaled:
            return judge::ExecutionError{judge::error::RuntimeError{
                "- the process was terminated with the following error:\n" +
                DescribeSignal(exit.code, exit.core_dumped)}};
        case ExitKind::kExited:
            if (exit.code != 0) {
                return judge::ExecutionError{judge::error::RuntimeError{
                    "- the " + who + " returned a non-zero return code: " +
                    std::to_string(exit.code)}};
            }
            return std::nullopt;
    }
    return std::nullopt;
}

}  // namespace verdict::sandbox
