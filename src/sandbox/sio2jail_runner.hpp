#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "files/temp_file.hpp"
#include "judge/test_result.hpp"
#include "utils/cancellation.hpp"

namespace verdict::sandbox {

struct Sio2jailReport {
    std::string status;
    double time_seconds = 0.0;
    std::int64_t memory_kilobytes = 0;
    // Second line of the report, present for RE/RV.
    std::optional<std::string> message;
};

// Parses "<status> <?> <time_ms> <?> <memory_kb> <?>[\n<message>]". Returns nullopt when the
// report has fewer than six fields; throws JudgeError when a numeric field is not a number.
std::optional<Sio2jailReport> ParseReport(const std::string& text);

// Runs programs under sio2jail for time and memory accounting. The tool path is resolved once
// and never changes, so one instance can be shared by every worker.
class Sio2jailRunner {
public:
    explicit Sio2jailRunner(std::filesystem::path sio2jail_path);

    // `configured` wins when non-empty; otherwise $XDG_BIN_HOME/sio2jail or ~/.local/bin/sio2jail.
    static std::optional<std::filesystem::path> Locate(const std::string& configured);

    judge::RunOutcome Run(const std::string& executable,
                          const files::FileHandle& stdin_file,
                          const files::FileHandle& stdout_file,
                          std::chrono::seconds timeout,
                          std::int64_t memory_limit_kb,
                          const files::FileHandle& report_file,
                          const files::FileHandle& stderr_file,
                          const utils::CancellationToken* cancel = nullptr) const;

    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace verdict::sandbox
