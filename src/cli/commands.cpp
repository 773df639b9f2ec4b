#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <signal.h>

#include "config/config_loader.hpp"
#include "files/scratch_pool.hpp"
#include "files/temp_file.hpp"
#include "judge/compiler.hpp"
#include "judge/test_suite.hpp"
#include "sandbox/sio2jail_runner.hpp"
#include "utils/cancellation.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

constexpr int kExitFailedTests = 1;
constexpr int kExitUsage = 2;
constexpr int kExitInterrupted = 130;

struct CliOptions {
    std::string source;
    std::optional<std::string> checker;
    bool generate = false;
};

void HandleSignal(int signal) {
    g_signal = signal;
}

void PrintUsage() {
    std::cout << "Usage: verdict_cli <solution.cpp> [-i DIR] [-o DIR] [--in-ext EXT] [--out-ext EXT]\n"
                 "                   [-t SECONDS] [--compile-timeout SECONDS] [-c CHECKER]\n"
                 "                   [-s] [-m KB] [-w WORKERS] [-g] [--compile-command TEMPLATE]"
              << std::endl;
}

bool ParseInt(const std::string& value, long long& out) {
    try {
        std::size_t consumed = 0;
        out = std::stoll(value, &consumed);
        return consumed == value.size() && out >= 0;
    } catch (const std::logic_error&) {
        return false;
    }
}

// Flags override the loaded configuration in place.
bool ParseArguments(int argc, char** argv, CliOptions& options, verdict::config::Config& config) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cout << "Missing value for " << arg << std::endl;
                return false;
            }
            out = argv[++i];
            return true;
        };
        auto next_number = [&](long long& out) {
            std::string value;
            if (!next(value)) {
                return false;
            }
            if (!ParseInt(value, out)) {
                std::cout << "Invalid number for " << arg << ": " << value << std::endl;
                return false;
            }
            return true;
        };

        long long number = 0;
        std::string value;
        if (arg == "-i" || arg == "--in") {
            if (!next(config.tests.input_dir)) {
                return false;
            }
        } else if (arg == "-o" || arg == "--out") {
            if (!next(config.tests.output_dir)) {
                return false;
            }
        } else if (arg == "--in-ext") {
            if (!next(config.tests.in_extension)) {
                return false;
            }
        } else if (arg == "--out-ext") {
            if (!next(config.tests.out_extension)) {
                return false;
            }
        } else if (arg == "-t" || arg == "--timeout") {
            if (!next_number(number)) {
                return false;
            }
            config.run.timeout_s = static_cast<int>(number);
        } else if (arg == "--compile-timeout") {
            if (!next_number(number)) {
                return false;
            }
            config.compile.timeout_s = static_cast<int>(number);
        } else if (arg == "--compile-command") {
            if (!next(config.compile.command)) {
                return false;
            }
        } else if (arg == "-c" || arg == "--checker") {
            if (!next(value)) {
                return false;
            }
            options.checker = value;
        } else if (arg == "-s" || arg == "--sio2jail") {
            config.run.use_sandbox = true;
        } else if (arg == "-m" || arg == "--memory-limit") {
            if (!next_number(number)) {
                return false;
            }
            config.run.memory_limit_kb = number;
        } else if (arg == "-w" || arg == "--workers") {
            if (!next_number(number)) {
                return false;
            }
            config.run.workers = static_cast<int>(number);
        } else if (arg == "-g" || arg == "--generate") {
            options.generate = true;
        } else if (!arg.empty() && arg.front() == '-') {
            std::cout << "Unknown option " << arg << std::endl;
            return false;
        } else if (options.source.empty()) {
            options.source = arg;
        } else {
            std::cout << "Unexpected argument " << arg << std::endl;
            return false;
        }
    }
    return !options.source.empty();
}

bool IsSourceFile(const std::filesystem::path& path) {
    const auto extension = path.extension().string();
    return extension == ".cpp" || extension == ".cc" || extension == ".cxx" || extension == ".c";
}

std::optional<std::string> BuildExecutable(const std::filesystem::path& source,
                                           const std::filesystem::path& build_dir,
                                           const verdict::config::Config& config,
                                           const verdict::utils::CancellationToken& cancel) {
    std::filesystem::create_directories(build_dir);
    const auto result = verdict::judge::Compile(
        source,
        build_dir,
        std::chrono::seconds(config.compile.timeout_s),
        config.compile.command,
        &cancel);
    if (!result.ok) {
        std::cout << "Compilation of " << source.string() << " failed:\n" << result.message << std::endl;
        return std::nullopt;
    }
    std::cout << "Compiled " << source.filename().string() << " in "
              << verdict::judge::FormatExecution({result.compile_time_seconds, std::nullopt}) << std::endl;
    return result.executable_path;
}

void PrintEntry(const verdict::judge::SuiteEntry& entry) {
    if (!entry.harness_error.empty()) {
        std::cout << "Test " << entry.test_name << ": internal error: " << entry.harness_error << std::endl;
        return;
    }
    if (entry.generated) {
        if (!entry.generated->Ok()) {
            std::cout << "Test " << entry.test_name << ": "
                      << verdict::judge::Describe(*entry.generated->error) << std::endl;
        }
        return;
    }
    if (entry.outcome && !std::holds_alternative<verdict::judge::verdicts::Correct>(entry.outcome->verdict)) {
        std::cout << verdict::judge::Describe(entry.outcome->verdict) << " ("
                  << verdict::judge::FormatExecution(entry.outcome->execution) << ")" << std::endl;
    }
}

void PrintSummary(const verdict::judge::SuiteSummary& summary, bool generate) {
    std::cout << std::endl;
    if (generate) {
        std::cout << "Generated " << summary.generated << "/" << summary.total << " output files";
        if (summary.generation_failures > 0) {
            std::cout << ", " << summary.generation_failures << " failed";
        }
        std::cout << std::endl;
    } else {
        std::cout << "Correct: " << summary.correct << "/" << summary.total
                  << "  Incorrect: " << summary.incorrect
                  << "  Errors: " << summary.program_errors
                  << "  Checker errors: " << summary.checker_errors
                  << "  No output file: " << summary.no_output_files << std::endl;
    }
    if (summary.harness_failures > 0) {
        std::cout << "Internal errors: " << summary.harness_failures << std::endl;
    }
    if (!summary.slowest_test.empty()) {
        std::cout << "Slowest test: " << summary.slowest_test << " ("
                  << verdict::judge::FormatExecution({summary.slowest_seconds, std::nullopt}) << ")";
        if (summary.peak_memory_kb) {
            std::cout << ", peak memory: " << *summary.peak_memory_kb << " KB";
        }
        std::cout << std::endl;
    }
    if (summary.cancelled) {
        std::cout << "Interrupted, " << summary.skipped << " tests were not run." << std::endl;
    }
}

int Run(const CliOptions& options, const verdict::config::Config& config) {
    verdict::utils::CancellationToken cancel;
    std::atomic<bool> done{false};
    std::thread signal_watcher([&cancel, &done] {
        while (!done.load()) {
            if (g_signal != 0) {
                cancel.Cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });
    struct WatcherGuard {
        std::atomic<bool>& done;
        std::thread& thread;
        ~WatcherGuard() {
            done.store(true);
            if (thread.joinable()) {
                thread.join();
            }
        }
    } watcher_guard{done, signal_watcher};

    verdict::files::TemporaryDirectory workdir("verdict");

    const auto executable = BuildExecutable(options.source, workdir.Path() / "solution", config, cancel);
    if (!executable) {
        return kExitUsage;
    }

    std::optional<std::string> checker;
    if (options.checker) {
        if (IsSourceFile(*options.checker)) {
            checker = BuildExecutable(*options.checker, workdir.Path() / "checker", config, cancel);
            if (!checker) {
                return kExitUsage;
            }
        } else {
            checker = std::filesystem::absolute(*options.checker).string();
        }
    }

    std::optional<verdict::sandbox::Sio2jailRunner> sio2jail;
    if (config.run.use_sandbox) {
        const auto path = verdict::sandbox::Sio2jailRunner::Locate(config.run.sandbox_path);
        if (!path) {
            return kExitUsage;
        }
        sio2jail.emplace(*path);
    }

    std::size_t workers = config.run.workers > 0 ? static_cast<std::size_t>(config.run.workers)
                                                 : std::thread::hardware_concurrency();
    workers = std::max<std::size_t>(workers, 1);

    const auto scratch_dir = workdir.Path() / "scratch";
    std::filesystem::create_directories(scratch_dir);
    verdict::files::ScratchPool pool(workers * verdict::files::kScratchFilesPerTest);
    pool.Fill(scratch_dir);

    verdict::judge::SuiteOptions suite_options{};
    suite_options.executable = *executable;
    suite_options.checker = checker;
    suite_options.input_dir = config.tests.input_dir;
    suite_options.output_dir = config.tests.output_dir;
    suite_options.in_extension = config.tests.in_extension;
    suite_options.out_extension = config.tests.out_extension;
    suite_options.timeout = std::chrono::seconds(config.run.timeout_s);
    suite_options.memory_limit_kb = config.run.memory_limit_kb;
    suite_options.workers = workers;
    suite_options.generate = options.generate;

    const auto names = verdict::judge::DiscoverTests(suite_options.input_dir, suite_options.in_extension);
    if (names.empty()) {
        std::cout << "No tests found in " << suite_options.input_dir.string() << std::endl;
        return kExitUsage;
    }
    if (options.generate) {
        std::filesystem::create_directories(suite_options.output_dir);
    }

    verdict::judge::TestEnvironment env{pool, sio2jail ? &*sio2jail : nullptr, &cancel};
    verdict::judge::TestSuite suite(suite_options, env);
    const auto entries = suite.Run(names, PrintEntry);
    const auto summary = verdict::judge::TestSuite::Summarize(entries, suite.Cancelled());
    PrintSummary(summary, options.generate);

    if (summary.cancelled) {
        return kExitInterrupted;
    }
    return summary.AllPassed() ? 0 : kExitFailedTests;
}

}  // namespace

int main(int argc, char** argv) {
    auto config = verdict::config::LoadConfig();
    CliOptions options{};
    if (!ParseArguments(argc, argv, options, config)) {
        PrintUsage();
        return kExitUsage;
    }
    verdict::utils::SetMinLogLevel(
        verdict::utils::ParseLogLevel(config.log_level, verdict::utils::LogLevel::kInfo));

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    try {
        return Run(options, config);
    } catch (const verdict::RunCancelled&) {
        std::cout << "Interrupted." << std::endl;
        return kExitInterrupted;
    } catch (const verdict::JudgeError& ex) {
        verdict::utils::Log(verdict::utils::LogLevel::kError, "verdict", ex.what());
        return kExitUsage;
    } catch (const std::filesystem::filesystem_error& ex) {
        verdict::utils::Log(verdict::utils::LogLevel::kError, "verdict", ex.what());
        return kExitUsage;
    }
}
