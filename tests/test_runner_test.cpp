#include "judge/test_runner.hpp"

#include <gtest/gtest.h>

#include "test_helpers.hpp"
#include "utils/errors.hpp"

using namespace verdict;
using namespace verdict::judge;

namespace {

class RunTestFixture : public ::testing::Test {
protected:
    RunTestFixture() {
        pool_.Fill(dir_.Path());
        std::filesystem::create_directories(dir_.Path() / "in");
        std::filesystem::create_directories(dir_.Path() / "out");
    }

    ~RunTestFixture() override {
        EXPECT_EQ(pool_.Available(), pool_.Capacity());
    }

    TestRequest Request(const std::string& program_body, const std::string& input) {
        TestRequest request{};
        request.executable = dir_.WriteScript("program", program_body);
        request.test_name = "sample";
        request.input_path = dir_.WriteText("in/sample.in", input);
        request.output_dir = dir_.Path() / "out";
        request.timeout = std::chrono::seconds(2);
        request.memory_limit_kb = 65536;
        return request;
    }

    void WriteReference(const std::string& content) {
        dir_.WriteText("out/sample.out", content);
    }

    TestEnvironment Env() { return TestEnvironment{pool_}; }

    test_support::ScriptDir dir_;
    files::ScratchPool pool_{files::kScratchFilesPerTest};
};

}  // namespace

TEST_F(RunTestFixture, matching_output_is_correct) {
    const auto request = Request("cat", "1 2\n3\n");
    WriteReference("1 2  \n3\n\n\n");

    const auto outcome = RunTest(request, Env());
    ASSERT_TRUE(std::holds_alternative<verdicts::Correct>(outcome.verdict)) << Describe(outcome.verdict);
    EXPECT_EQ(TestName(outcome.verdict), "sample");
    EXPECT_GT(outcome.execution.time_seconds, 0.0);
    EXPECT_FALSE(outcome.execution.memory_kilobytes);
}

TEST_F(RunTestFixture, mismatch_renders_a_diff) {
    const auto request = Request("cat", "1\n2\n");
    WriteReference("1\n9\n");

    const auto outcome = RunTest(request, Env());
    ASSERT_TRUE(std::holds_alternative<verdicts::Incorrect>(outcome.verdict));
    const auto& diff = std::get<verdicts::Incorrect>(outcome.verdict).error;
    EXPECT_NE(diff.find("Line"), std::string::npos);
    EXPECT_NE(diff.find("9"), std::string::npos);
}

TEST_F(RunTestFixture, missing_reference_reports_no_output_file) {
    const auto request = Request("cat", "1\n");

    const auto outcome = RunTest(request, Env());
    ASSERT_TRUE(std::holds_alternative<verdicts::NoOutputFile>(outcome.verdict));
    EXPECT_EQ(outcome.execution.time_seconds, 0.0);
    EXPECT_EQ(Describe(outcome.verdict).find("Test sample"), 0u);
}

TEST_F(RunTestFixture, failing_program_is_a_program_error) {
    const auto request = Request("exit 1", "");
    WriteReference("anything\n");

    const auto outcome = RunTest(request, Env());
    ASSERT_TRUE(std::holds_alternative<verdicts::ProgramError>(outcome.verdict));
    const auto& error = std::get<verdicts::ProgramError>(outcome.verdict).error;
    ASSERT_TRUE(std::holds_alternative<error::RuntimeError>(error));
    EXPECT_EQ(std::get<error::RuntimeError>(error).message,
              "- the program returned a non-zero return code: 1");
}

TEST_F(RunTestFixture, invalid_utf8_output) {
    const auto request = Request(R"(printf '\377\376')", "");
    WriteReference("anything\n");

    const auto outcome = RunTest(request, Env());
    ASSERT_TRUE(std::holds_alternative<verdicts::ProgramError>(outcome.verdict));
    EXPECT_TRUE(std::holds_alternative<error::InvalidOutput>(
        std::get<verdicts::ProgramError>(outcome.verdict).error));
}

TEST_F(RunTestFixture, checker_decides_the_verdict) {
    auto request = Request("cat", "42");
    request.checker = dir_.WriteScript("accept", "cat > /dev/null\necho C");
    auto outcome = RunTest(request, Env());
    EXPECT_TRUE(std::holds_alternative<verdicts::Correct>(outcome.verdict)) << Describe(outcome.verdict);

    request.checker = dir_.WriteScript("reject", "cat > /dev/null\necho 'I wrong answer'");
    outcome = RunTest(request, Env());
    ASSERT_TRUE(std::holds_alternative<verdicts::Incorrect>(outcome.verdict));
    EXPECT_EQ(std::get<verdicts::Incorrect>(outcome.verdict).error, "wrong answer");

    request.checker = dir_.WriteScript("broken", "cat > /dev/null\necho maybe");
    outcome = RunTest(request, Env());
    ASSERT_TRUE(std::holds_alternative<verdicts::CheckerError>(outcome.verdict));
    EXPECT_TRUE(std::holds_alternative<error::IncorrectCheckerFormat>(
        std::get<verdicts::CheckerError>(outcome.verdict).error));
}

TEST_F(RunTestFixture, checker_receives_input_then_output) {
    auto request = Request("echo answer", "question");
    request.checker = dir_.WriteScript("checker", R"(read input
read output
if [ "$input" = question ] && [ "$output" = answer ]; then echo C; else echo "I got $input/$output"; fi)");

    const auto outcome = RunTest(request, Env());
    EXPECT_TRUE(std::holds_alternative<verdicts::Correct>(outcome.verdict)) << Describe(outcome.verdict);
}

TEST_F(RunTestFixture, sandboxed_run_reports_memory) {
    const sandbox::Sio2jailRunner sio2jail(dir_.WriteScript("sio2jail", "cat\necho 'OK 0 250 0 1024 0' >&3"));
    const auto request = Request("cat", "7\n");
    WriteReference("7\n");

    TestEnvironment env{pool_, &sio2jail};
    const auto outcome = RunTest(request, env);
    ASSERT_TRUE(std::holds_alternative<verdicts::Correct>(outcome.verdict)) << Describe(outcome.verdict);
    EXPECT_DOUBLE_EQ(outcome.execution.time_seconds, 0.25);
    ASSERT_TRUE(outcome.execution.memory_kilobytes);
    EXPECT_EQ(*outcome.execution.memory_kilobytes, 1024);
}

TEST_F(RunTestFixture, sandboxed_memory_limit) {
    const sandbox::Sio2jailRunner sio2jail(dir_.WriteScript("sio2jail", "echo 'MLE 0 10 0 70000 0' >&3"));
    const auto request = Request("cat", "7\n");
    WriteReference("7\n");

    TestEnvironment env{pool_, &sio2jail};
    const auto outcome = RunTest(request, env);
    ASSERT_TRUE(std::holds_alternative<verdicts::ProgramError>(outcome.verdict));
    EXPECT_TRUE(std::holds_alternative<error::MemoryLimitExceeded>(
        std::get<verdicts::ProgramError>(outcome.verdict).error));
    EXPECT_EQ(*outcome.execution.memory_kilobytes, 70000);
}

TEST_F(RunTestFixture, cancelled_run_throws) {
    const auto request = Request("exec sleep 10", "");
    utils::CancellationToken cancel;
    cancel.Cancel();

    TestEnvironment env{pool_, nullptr, &cancel};
    EXPECT_THROW(RunTest(request, env), RunCancelled);
}

TEST_F(RunTestFixture, generate_writes_the_reference) {
    const auto request = Request("echo generated", "");

    const auto outcome = GenerateOutput(request, Env());
    ASSERT_TRUE(outcome.Ok());
    EXPECT_EQ(files::ReadFile(ReferenceOutputPath(request)), "generated\n");
}

TEST_F(RunTestFixture, failed_generation_writes_nothing) {
    const auto request = Request("exit 2", "");

    const auto outcome = GenerateOutput(request, Env());
    EXPECT_FALSE(outcome.Ok());
    EXPECT_FALSE(std::filesystem::exists(ReferenceOutputPath(request)));
}
