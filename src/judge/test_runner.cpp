#include "judge/test_runner.hpp"

#include <boost/locale/encoding_utf.hpp>

#include "judge/checker.hpp"
#include "judge/diff_renderer.hpp"
#include "files/temp_file.hpp"
#include "sandbox/direct_runner.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace verdict::judge {
namespace {

struct ProgramRun {
    RunOutcome outcome;
    std::string output;
};

bool IsValidUtf8(const std::string& text) {
    try {
        boost::locale::conv::utf_to_utf<char32_t>(text, boost::locale::conv::stop);
    } catch (const boost::locale::conv::conversion_error&) {
        return false;
    }
    return true;
}

ProgramRun RunProgram(const TestRequest& request, const TestEnvironment& env) {
    const auto input_file = files::OpenForReading(request.input_path);
    files::ScratchLease output_lease(env.pool);
    const auto output_file = files::CreateFile(output_lease.Path());

    ProgramRun run{};
    if (env.sandbox != nullptr) {
        files::ScratchLease report_lease(env.pool);
        files::ScratchLease stderr_lease(env.pool);
        const auto report_file = files::CreateFile(report_lease.Path());
        const auto stderr_file = files::CreateFile(stderr_lease.Path());
        run.outcome = env.sandbox->Run(request.executable, input_file, output_file, request.timeout,
                                       request.memory_limit_kb, report_file, stderr_file, env.cancel);
    } else {
        run.outcome = sandbox::DirectRunner::Run(request.executable, input_file, output_file,
                                                 request.timeout, env.cancel);
    }
    if (run.outcome.Ok()) {
        run.output = files::ReadAll(output_file);
    }
    return run;
}

}  // namespace

std::filesystem::path ReferenceOutputPath(const TestRequest& request) {
    return request.output_dir / (request.test_name + request.out_extension);
}

TestOutcome RunTest(const TestRequest& request, const TestEnvironment& env) {
    auto run = RunProgram(request, env);
    const auto& execution = run.outcome.result;
    if (run.outcome.error) {
        return {verdicts::ProgramError{request.test_name, *run.outcome.error}, execution};
    }
    if (!IsValidUtf8(run.output)) {
        return {verdicts::ProgramError{request.test_name, error::InvalidOutput{}}, execution};
    }

    if (!request.checker) {
        const auto reference_path = ReferenceOutputPath(request);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(reference_path, ec)) {
            return {verdicts::NoOutputFile{request.test_name}, ExecutionResult{}};
        }
        const auto reference = files::ReadFile(reference_path);
        if (OutputsMatch(reference, run.output)) {
            return {verdicts::Correct{request.test_name}, execution};
        }
        return {verdicts::Incorrect{request.test_name, RenderDiff(reference, run.output, TerminalWidth())},
                execution};
    }

    const auto program_input = files::ReadFile(request.input_path);
    files::ScratchLease checker_in(env.pool);
    files::ScratchLease checker_out(env.pool);
    auto verdict = Verify(request.test_name, *request.checker, program_input, run.output,
                          checker_in.Path(), checker_out.Path(), request.timeout, env.cancel);
    return {std::move(verdict), execution};
}

RunOutcome GenerateOutput(const TestRequest& request, const TestEnvironment& env) {
    auto run = RunProgram(request, env);
    if (run.outcome.Ok()) {
        files::WriteFile(ReferenceOutputPath(request), run.output);
        utils::Log(utils::LogLevel::kDebug, "run", "generated " + ReferenceOutputPath(request).string());
    }
    return run.outcome;
}

}  // namespace verdict::judge
