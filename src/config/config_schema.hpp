#pragma once

#include <cstdint>
#include <string>

namespace verdict::config {

struct CompileConfig {
    std::string command = "g++ -std=c++20 -O3 -static <IN> -o <OUT>";
    int timeout_s = 10;
};

struct RunConfig {
    int timeout_s = 5;
    std::int64_t memory_limit_kb = 1048576;
    bool use_sandbox = false;
    std::string sandbox_path;
    int workers = 0;
};

struct TestsConfig {
    std::string input_dir = "in";
    std::string output_dir = "out";
    std::string in_extension = ".in";
    std::string out_extension = ".out";
};

struct Config {
    CompileConfig compile;
    RunConfig run;
    TestsConfig tests;
    std::string log_level = "info";
};

}  // namespace verdict::config
