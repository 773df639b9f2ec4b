#include "judge/compiler.hpp"

#include <optional>
#include <system_error>

#include <boost/process.hpp>
#include <boost/tokenizer.hpp>

#include "files/temp_file.hpp"
#include "sandbox/child_wait.hpp"
#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace verdict::judge {
namespace bp = boost::process;
namespace {

constexpr const char* kNotFound = "The compiler was not found!";

void ReplaceAll(std::string& text, const std::string& from, const std::string& to) {
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

CompileResult Failure(std::string message) {
    CompileResult result{};
    result.message = std::move(message);
    return result;
}

}  // namespace

std::vector<std::string> TokenizeCommand(const std::string& command) {
    using Separator = boost::escaped_list_separator<char>;
    std::vector<std::string> tokens;
    try {
        boost::tokenizer<Separator> tokenizer(command, Separator('\\', ' ', '"'));
        for (const auto& token : tokenizer) {
            if (!token.empty()) {
                tokens.push_back(token);
            }
        }
    } catch (const boost::escaped_list_error& ex) {
        throw JudgeError("The compile command is invalid: " + std::string(ex.what()));
    }
    return tokens;
}

CompileResult Compile(const std::filesystem::path& source,
                      const std::filesystem::path& scratch_dir,
                      std::chrono::seconds timeout,
                      const std::string& command_template,
                      const utils::CancellationToken* cancel) {
    const auto executable = (scratch_dir / (source.stem().string() + ".o")).string();

    auto argv = TokenizeCommand(command_template);
    if (argv.empty()) {
        return Failure("The compile command is invalid!");
    }
    for (auto& token : argv) {
        ReplaceAll(token, "<IN>", source.string());
        ReplaceAll(token, "<OUT>", executable);
    }

    boost::filesystem::path program = argv.front();
    if (argv.front().find('/') == std::string::npos) {
        program = bp::search_path(argv.front());
        if (program.empty()) {
            return Failure(kNotFound);
        }
    }
    const std::vector<std::string> args(argv.begin() + 1, argv.end());

    auto stderr_file = files::CreateTempFile();
    utils::Log(utils::LogLevel::kDebug, "compile", utils::Join(argv, " "));

    const auto started = std::chrono::steady_clock::now();
    std::optional<bp::child> child;
    try {
        child.emplace(
            bp::exe = program,
            bp::args = args,
            bp::std_in < bp::null,
            bp::std_err > stderr_file.get());
    } catch (const bp::process_error& ex) {
        if (ex.code() == std::errc::no_such_file_or_directory) {
            return Failure(kNotFound);
        }
        return Failure(ex.what());
    }

    const auto exit = sandbox::WaitForChild(*child, timeout, started, cancel);
    switch (exit.kind) {
        case sandbox::ExitKind::kTimedOut:
            utils::Log(utils::LogLevel::kWarn, "compile", source.string() + " timed out");
            return Failure("Compilation timed out");
        case sandbox::ExitKind::kSignaled: {
            auto diagnostics = files::ReadAll(stderr_file);
            if (!diagnostics.empty() && diagnostics.back() != '\n') {
                diagnostics.push_back('\n');
            }
            return Failure(diagnostics + "The compiler was terminated: " +
                           sandbox::DescribeSignal(exit.code, exit.core_dumped));
        }
        case sandbox::ExitKind::kExited:
            if (exit.code != 0) {
                return Failure(files::ReadAll(stderr_file));
            }
            break;
    }

    CompileResult result{};
    result.ok = true;
    result.executable_path = executable;
    result.compile_time_seconds = exit.elapsed_seconds;
    utils::Log(utils::LogLevel::kDebug, "compile",
               source.string() + " -> " + executable + " in " +
               std::to_string(result.compile_time_seconds) + "s");
    return result;
}

}  // namespace verdict::judge
