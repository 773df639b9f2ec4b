#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "judge/test_result.hpp"
#include "judge/test_runner.hpp"

namespace verdict::judge {

struct SuiteOptions {
    std::string executable;
    std::optional<std::string> checker;
    std::filesystem::path input_dir;
    std::filesystem::path output_dir;
    std::string in_extension = ".in";
    std::string out_extension = ".out";
    std::chrono::seconds timeout{5};
    std::int64_t memory_limit_kb = 1048576;
    std::size_t workers = 1;
    // Write the program's output as reference files instead of judging it.
    bool generate = false;
};

struct SuiteEntry {
    std::string test_name;
    std::optional<TestOutcome> outcome;
    std::optional<RunOutcome> generated;
    // Set when the harness itself failed on this test.
    std::string harness_error;

    bool Finished() const { return outcome || generated || !harness_error.empty(); }
};

struct SuiteSummary {
    std::size_t total = 0;
    std::size_t correct = 0;
    std::size_t incorrect = 0;
    std::size_t program_errors = 0;
    std::size_t checker_errors = 0;
    std::size_t no_output_files = 0;
    std::size_t generated = 0;
    std::size_t generation_failures = 0;
    std::size_t harness_failures = 0;
    std::size_t skipped = 0;
    std::string slowest_test;
    double slowest_seconds = 0.0;
    std::optional<std::int64_t> peak_memory_kb;
    bool cancelled = false;

    bool AllPassed() const;
};

// Sorted names of the files in `input_dir` ending in `in_extension`, extension stripped.
std::vector<std::string> DiscoverTests(const std::filesystem::path& input_dir,
                                       const std::string& in_extension);

class TestSuite {
public:
    using ResultCallback = std::function<void(const SuiteEntry&)>;

    TestSuite(SuiteOptions options, TestEnvironment env);

    // Runs every test on `options.workers` threads until the environment's token fires. Entries
    // come back in input order; those not reached are left unfinished. `on_result` is called
    // serially.
    std::vector<SuiteEntry> Run(const std::vector<std::string>& test_names,
                                const ResultCallback& on_result = {});

    bool Cancelled() const { return cancelled_.load(); }

    static SuiteSummary Summarize(const std::vector<SuiteEntry>& entries, bool cancelled);

private:
    TestRequest MakeRequest(const std::string& test_name) const;
    // False when the worker should stop taking tests.
    bool RunOne(SuiteEntry& entry);

    SuiteOptions options_;
    TestEnvironment env_;
    std::atomic<bool> cancelled_{false};
};

}  // namespace verdict::judge
