#include "judge/checker.hpp"

#include <cstdio>

#include "files/temp_file.hpp"
#include "sandbox/direct_runner.hpp"
#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace verdict::judge {

TestResult InterpretCheckerOutput(const std::string& test_name, const std::string& checker_output) {
    if (checker_output.empty()) {
        return verdicts::CheckerError{
            test_name, error::IncorrectCheckerFormat{"the checker returned an empty file"}};
    }
    const char verdict = checker_output.front();
    if (verdict == 'C') {
        return verdicts::Correct{test_name};
    }
    if (verdict != 'I') {
        return verdicts::CheckerError{
            test_name,
            error::IncorrectCheckerFormat{"the first character of the checker's output wasn't C or I"}};
    }
    // "I: reason" / "I reason"
    const auto explanation = checker_output.size() > 2 ? checker_output.substr(2) : std::string();
    return verdicts::Incorrect{test_name, utils::Trim(explanation)};
}

TestResult Verify(const std::string& test_name,
                  const std::string& checker_path,
                  const std::string& program_input,
                  const std::string& program_output,
                  const std::filesystem::path& scratch_in,
                  const std::filesystem::path& scratch_out,
                  std::chrono::seconds timeout,
                  const utils::CancellationToken* cancel) {
    {
        auto input_file = files::CreateFile(scratch_in);
        const auto blob = program_input + "\n" + program_output;
        if (std::fwrite(blob.data(), 1, blob.size(), input_file.get()) != blob.size() ||
            std::fflush(input_file.get()) != 0) {
            throw JudgeError("Failed to write to checker input file " + scratch_in.string());
        }
    }
    const auto input_file = files::OpenForReading(scratch_in);
    const auto output_file = files::CreateFile(scratch_out);

    const auto outcome = sandbox::DirectRunner::Run(
        checker_path, input_file, output_file, timeout, cancel, "checker");
    if (outcome.error) {
        utils::Log(utils::LogLevel::kWarn, "checker", test_name + ": " + Describe(*outcome.error));
        return verdicts::CheckerError{test_name, *outcome.error};
    }

    return InterpretCheckerOutput(test_name, files::ReadAll(output_file));
}

}  // namespace verdict::judge
