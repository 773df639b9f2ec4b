#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <string>

#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace verdict::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetConfigPath() {
    return GetHomePath() / ".verdict" / "config.json";
}

void ApplyString(std::string& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("compile") && data["compile"].is_object()) {
        const auto& compile = data["compile"];
        ApplyString(config.compile.command, compile, "command");
        if (compile.contains("timeoutS") && compile["timeoutS"].is_number_integer()) {
            config.compile.timeout_s = compile["timeoutS"].get<int>();
        }
    }

    if (data.contains("run") && data["run"].is_object()) {
        const auto& run = data["run"];
        if (run.contains("timeoutS") && run["timeoutS"].is_number_integer()) {
            config.run.timeout_s = run["timeoutS"].get<int>();
        }
        if (run.contains("memoryLimitKb") && run["memoryLimitKb"].is_number_integer()) {
            config.run.memory_limit_kb = run["memoryLimitKb"].get<std::int64_t>();
        }
        if (run.contains("useSandbox") && run["useSandbox"].is_boolean()) {
            config.run.use_sandbox = run["useSandbox"].get<bool>();
        }
        ApplyString(config.run.sandbox_path, run, "sandboxPath");
        if (run.contains("workers") && run["workers"].is_number_integer()) {
            config.run.workers = run["workers"].get<int>();
        }
    }

    if (data.contains("tests") && data["tests"].is_object()) {
        const auto& tests = data["tests"];
        ApplyString(config.tests.input_dir, tests, "inputDir");
        ApplyString(config.tests.output_dir, tests, "outputDir");
        ApplyString(config.tests.in_extension, tests, "inExtension");
        ApplyString(config.tests.out_extension, tests, "outExtension");
    }

    ApplyString(config.log_level, data, "logLevel");
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        utils::Log(utils::LogLevel::kWarn, "config", "ignoring non-numeric value '" + value + "'");
        return fallback;
    }
}

std::int64_t ParseInt64(const std::string& value, std::int64_t fallback) {
    try {
        return std::stoll(value);
    } catch (const std::exception&) {
        utils::Log(utils::LogLevel::kWarn, "config", "ignoring non-numeric value '" + value + "'");
        return fallback;
    }
}

void ApplyFile(Config& config, const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return;
    }
    try {
        std::ifstream input(path);
        nlohmann::json data;
        input >> data;
        ApplyConfigFromJson(config, data);
    } catch (const nlohmann::json::exception& ex) {
        // Keep defaults on parse errors
        utils::Log(utils::LogLevel::kWarn, "config",
                   "failed to parse " + path.string() + ": " + ex.what());
    }
}

void ApplyEnvironment(Config& config) {
    const auto compile_command = GetEnv("VERDICT_COMPILE_COMMAND");
    if (!compile_command.empty()) {
        config.compile.command = compile_command;
    }

    const auto compile_timeout = GetEnv("VERDICT_COMPILE_TIMEOUT_S");
    if (!compile_timeout.empty()) {
        config.compile.timeout_s = ParseInt(compile_timeout, config.compile.timeout_s);
    }

    const auto timeout = GetEnv("VERDICT_RUN_TIMEOUT_S");
    if (!timeout.empty()) {
        config.run.timeout_s = ParseInt(timeout, config.run.timeout_s);
    }

    const auto memory_limit = GetEnv("VERDICT_RUN_MEMORY_LIMIT_KB");
    if (!memory_limit.empty()) {
        config.run.memory_limit_kb = ParseInt64(memory_limit, config.run.memory_limit_kb);
    }

    const auto use_sandbox = GetEnv("VERDICT_RUN_USE_SANDBOX");
    if (!use_sandbox.empty()) {
        config.run.use_sandbox = ParseBool(use_sandbox);
    }

    const auto sandbox_path = GetEnv("VERDICT_RUN_SANDBOX_PATH");
    if (!sandbox_path.empty()) {
        config.run.sandbox_path = sandbox_path;
    }

    const auto workers = GetEnv("VERDICT_RUN_WORKERS");
    if (!workers.empty()) {
        config.run.workers = ParseInt(workers, config.run.workers);
    }

    const auto log_level = GetEnv("VERDICT_LOG_LEVEL");
    if (!log_level.empty()) {
        config.log_level = log_level;
    }
}

}  // namespace

Config LoadConfigFromFile(const std::filesystem::path& path) {
    Config config{};
    ApplyFile(config, path);
    ApplyEnvironment(config);
    return config;
}

Config LoadConfig() {
    return LoadConfigFromFile(GetConfigPath());
}

}  // namespace verdict::config
