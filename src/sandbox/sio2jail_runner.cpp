#include "sandbox/sio2jail_runner.hpp"

#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <vector>

#include <boost/process.hpp>
#include <boost/process/posix.hpp>

#include "sandbox/child_wait.hpp"
#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace verdict::sandbox {
namespace bp = boost::process;
namespace {

constexpr int kReportFd = 3;
constexpr const char* kBadAllocAbort =
    "terminate called after throwing an instance of 'std::bad_alloc'\n"
    "  what():  std::bad_alloc\n";

std::vector<std::string> BuildArguments(const std::string& executable, std::int64_t memory_limit_kb) {
    return {
        "-f", std::to_string(kReportFd),
        "-o", "oiaug",
        "--mount-namespace", "off",
        "--pid-namespace", "off",
        "--uts-namespace", "off",
        "--ipc-namespace", "off",
        "--net-namespace", "off",
        "--capability-drop", "off",
        "--user-namespace", "off",
        "-s",
        "-m", std::to_string(memory_limit_kb),
        "--",
        executable
    };
}

JudgeError InvalidField(const std::string& value, const char* what) {
    return JudgeError(std::string("Sio2jail returned an invalid ") + what + " in the output: " + value);
}

double ParseDouble(const std::string& value, const char* what) {
    std::size_t consumed = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &consumed);
    } catch (const std::logic_error&) {
        throw InvalidField(value, what);
    }
    if (consumed != value.size()) {
        throw InvalidField(value, what);
    }
    return parsed;
}

std::int64_t ParseInt64(const std::string& value, const char* what) {
    std::size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::logic_error&) {
        throw InvalidField(value, what);
    }
    if (consumed != value.size()) {
        throw InvalidField(value, what);
    }
    return parsed;
}

std::optional<std::string> SecondLine(const std::string& text) {
    const auto first_end = text.find('\n');
    if (first_end == std::string::npos || first_end + 1 >= text.size()) {
        return std::nullopt;
    }
    const auto second_end = text.find('\n', first_end + 1);
    auto line = text.substr(first_end + 1,
                            second_end == std::string::npos ? std::string::npos
                                                            : second_end - first_end - 1);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

std::optional<judge::ExecutionError> ClassifyStatus(const Sio2jailReport& report) {
    using namespace judge::error;
    if (report.status == "OK") {
        return std::nullopt;
    }
    if (report.status == "RE" || report.status == "RV") {
        return judge::ExecutionError{RuntimeError{report.message ? "- " + *report.message : ""}};
    }
    if (report.status == "TLE") {
        return judge::ExecutionError{TimedOut{}};
    }
    if (report.status == "MLE") {
        return judge::ExecutionError{MemoryLimitExceeded{}};
    }
    if (report.status == "OLE") {
        return judge::ExecutionError{RuntimeError{"- output limit exceeded"}};
    }
    return judge::ExecutionError{
        Sio2jailError{"Sio2jail returned an invalid status in the output: " + report.status}};
}

}  // namespace

std::optional<Sio2jailReport> ParseReport(const std::string& text) {
    const auto fields = utils::SplitWhitespace(text);
    if (fields.size() < 6) {
        return std::nullopt;
    }
    Sio2jailReport report{};
    report.status = fields[0];
    report.time_seconds = ParseDouble(fields[2], "runtime") / 1000.0;
    report.memory_kilobytes = ParseInt64(fields[4], "memory usage");
    report.message = SecondLine(text);
    return report;
}

Sio2jailRunner::Sio2jailRunner(std::filesystem::path sio2jail_path)
    : path_(std::move(sio2jail_path)) {}

std::optional<std::filesystem::path> Sio2jailRunner::Locate(const std::string& configured) {
    std::filesystem::path candidate;
    if (!configured.empty()) {
        candidate = configured;
    } else if (const char* bin_home = std::getenv("XDG_BIN_HOME"); bin_home && *bin_home) {
        candidate = std::filesystem::path(bin_home) / "sio2jail";
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        candidate = std::filesystem::path(home) / ".local" / "bin" / "sio2jail";
    } else {
        utils::Log(utils::LogLevel::kError, "sio2jail",
                   "No valid home directory path could be retrieved from the operating system. "
                   "Sio2jail could not be found");
        return std::nullopt;
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(candidate, ec)) {
        utils::Log(utils::LogLevel::kError, "sio2jail",
                   "Sio2jail could not be found at " + candidate.string());
        return std::nullopt;
    }
    utils::Log(utils::LogLevel::kDebug, "sio2jail", "using " + candidate.string());
    return candidate;
}

judge::RunOutcome Sio2jailRunner::Run(const std::string& executable,
                                      const files::FileHandle& stdin_file,
                                      const files::FileHandle& stdout_file,
                                      std::chrono::seconds timeout,
                                      std::int64_t memory_limit_kb,
                                      const files::FileHandle& report_file,
                                      const files::FileHandle& stderr_file,
                                      const utils::CancellationToken* cancel) const {
    // dup2() onto the descriptor it already has would leave FD_CLOEXEC set
    const auto report_clone = files::MakeClonedStdio(report_file, kReportFd + 1);

    const auto started = std::chrono::steady_clock::now();
    std::optional<bp::child> child;
    try {
        child.emplace(
            bp::exe = path_.string(),
            bp::args = BuildArguments(executable, memory_limit_kb),
            bp::std_in < stdin_file.get(),
            bp::std_out > stdout_file.get(),
            bp::std_err > stderr_file.get(),
            bp::posix::fd.bind(kReportFd, ::fileno(report_clone.get())));
    } catch (const bp::process_error& ex) {
        throw JudgeError("Failed to run sio2jail at " + path_.string() + ": " + ex.what());
    }

    const auto exit = WaitForChild(*child, timeout, started, cancel);
    judge::RunOutcome outcome{};
    if (exit.kind == ExitKind::kTimedOut) {
        outcome.result.time_seconds = exit.elapsed_seconds;
        outcome.error = judge::error::TimedOut{};
        return outcome;
    }

    const auto error_output = files::ReadAll(stderr_file);
    if (!error_output.empty()) {
        if (error_output == kBadAllocAbort) {
            outcome.result.memory_kilobytes = memory_limit_kb;
            outcome.error = judge::error::MemoryLimitExceeded{};
        } else {
            utils::Log(utils::LogLevel::kWarn, "sio2jail", error_output);
            outcome.error = judge::error::Sio2jailError{error_output};
        }
        return outcome;
    }

    const auto report_text = files::ReadAll(report_file);
    const auto report = ParseReport(report_text);
    if (!report) {
        outcome.error = judge::error::Sio2jailError{"The sio2jail output is too short: " + report_text};
        return outcome;
    }
    outcome.result.time_seconds = report->time_seconds;
    outcome.result.memory_kilobytes = report->memory_kilobytes;

    if (exit.kind == ExitKind::kSignaled) {
        outcome.error = ClassifyExit(exit, "program");
        return outcome;
    }
    if (exit.code != 0) {
        outcome.error = judge::error::Sio2jailError{
            "Sio2jail returned an invalid status code: " + std::to_string(exit.code)};
        return outcome;
    }
    outcome.error = ClassifyStatus(*report);
    return outcome;
}

}  // namespace verdict::sandbox
