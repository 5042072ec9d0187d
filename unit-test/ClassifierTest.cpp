#include <csignal>
#include "gtest/gtest.h"
#include "judge/classifier.hpp"

using namespace std;
using namespace judged;

static raw_outcome exited(int exit_code) {
    raw_outcome outcome;
    outcome.cpu_time = 10;
    outcome.real_time = 12;
    outcome.memory = 1024 * 1024;
    outcome.exit_code = exit_code;
    return outcome;
}

TEST(ClassifierTest, AcceptedTest) {
    verdict v = classify(exited(0), "1 2\n3\n", "1 2\n3\n", compare_mode::IGNORE_TRAILING_SPACE);
    EXPECT_EQ(v.result, result_code::SUCCESS);
    EXPECT_EQ(v.error, error_kind::SUCCESS);
}

TEST(ClassifierTest, TrailingSpaceTest) {
    EXPECT_EQ(classify(exited(0), "1 2\n3\n", "1 2  \r\n3\t\n\n\n", compare_mode::IGNORE_TRAILING_SPACE).result,
              result_code::SUCCESS);
    EXPECT_EQ(classify(exited(0), "1 2\n3", "1 2\n3\n", compare_mode::IGNORE_TRAILING_SPACE).result,
              result_code::SUCCESS);
    EXPECT_EQ(classify(exited(0), "1 2\n3\n", "1 2  \n3\n", compare_mode::EXACT).result,
              result_code::WRONG_ANSWER);
}

TEST(ClassifierTest, WrongAnswerTest) {
    EXPECT_EQ(classify(exited(0), "1 2\n3\n", "1 3\n3\n", compare_mode::IGNORE_TRAILING_SPACE).result,
              result_code::WRONG_ANSWER);
    // 行首空白和行间空行不会被忽略
    EXPECT_EQ(classify(exited(0), "1\n2\n", " 1\n2\n", compare_mode::IGNORE_TRAILING_SPACE).result,
              result_code::WRONG_ANSWER);
    EXPECT_EQ(classify(exited(0), "1\n2\n", "1\n\n2\n", compare_mode::IGNORE_TRAILING_SPACE).result,
              result_code::WRONG_ANSWER);
    EXPECT_EQ(classify(exited(0), "1\n", "", compare_mode::IGNORE_TRAILING_SPACE).result,
              result_code::WRONG_ANSWER);
}

TEST(ClassifierTest, LimitPrecedesSignalTest) {
    raw_outcome outcome = exited(0);
    outcome.signal = SIGKILL;
    outcome.cpu_time_exceeded = true;
    outcome.real_time_exceeded = true;
    outcome.memory_exceeded = true;
    EXPECT_EQ(classify(outcome, "", "", compare_mode::EXACT).result, result_code::CPU_TIME_LIMIT_EXCEEDED);

    outcome.cpu_time_exceeded = false;
    EXPECT_EQ(classify(outcome, "", "", compare_mode::EXACT).result, result_code::REAL_TIME_LIMIT_EXCEEDED);

    outcome.real_time_exceeded = false;
    EXPECT_EQ(classify(outcome, "", "", compare_mode::EXACT).result, result_code::MEMORY_LIMIT_EXCEEDED);

    outcome.memory_exceeded = false;
    verdict v = classify(outcome, "", "", compare_mode::EXACT);
    EXPECT_EQ(v.result, result_code::RUNTIME_ERROR);
    EXPECT_EQ(v.error, error_kind::SUCCESS);
}

TEST(ClassifierTest, RuntimeErrorTest) {
    EXPECT_EQ(classify(exited(1), "", "", compare_mode::EXACT).result, result_code::RUNTIME_ERROR);

    raw_outcome outcome = exited(0);
    outcome.signal = SIGFPE;
    EXPECT_EQ(classify(outcome, "", "", compare_mode::EXACT).result, result_code::RUNTIME_ERROR);
}

TEST(ClassifierTest, OutputLimitExceededTest) {
    raw_outcome outcome = exited(0);
    outcome.output_truncated = true;
    // 即便截断后的输出恰好正确也不能判为正确
    verdict v = classify(outcome, "1\n", "1\n", compare_mode::IGNORE_TRAILING_SPACE);
    EXPECT_EQ(v.result, result_code::RUNTIME_ERROR);
    EXPECT_EQ(v.error, error_kind::OUTPUT_LIMIT_EXCEEDED);
}

TEST(ClassifierTest, SyscallRestrictedTest) {
    raw_outcome outcome = exited(0);
    outcome.signal = SIGSYS;
    outcome.syscall_restricted = true;
    verdict v = classify(outcome, "", "", compare_mode::EXACT);
    EXPECT_EQ(v.result, result_code::RUNTIME_ERROR);
    EXPECT_EQ(v.error, error_kind::SYSCALL_RESTRICTED);
}

TEST(ClassifierTest, EngineFaultTest) {
    raw_outcome outcome;
    outcome.engine_fault = error_kind::EXECVE_FAILED;
    verdict v = classify(outcome, "", "", compare_mode::EXACT);
    EXPECT_EQ(v.result, result_code::SYSTEM_ERROR);
    EXPECT_EQ(v.error, error_kind::EXECVE_FAILED);
}

TEST(ClassifierTest, SpecialJudgeTest) {
    EXPECT_EQ(classify(exited(0), spj_verdict::ACCEPTED).result, result_code::SUCCESS);
    EXPECT_EQ(classify(exited(0), spj_verdict::WRONG_ANSWER).result, result_code::WRONG_ANSWER);

    verdict v = classify(exited(0), spj_verdict::ERROR);
    EXPECT_EQ(v.result, result_code::SYSTEM_ERROR);
    EXPECT_EQ(v.error, error_kind::SPJ_ERROR);

    // 选手程序本身出错时不采用 special judge 的判定
    EXPECT_EQ(classify(exited(3), spj_verdict::ACCEPTED).result, result_code::RUNTIME_ERROR);
}

TEST(ClassifierTest, SpecialJudgeVerdictTest) {
    EXPECT_EQ(to_spj_verdict(exited(0)), spj_verdict::ACCEPTED);
    EXPECT_EQ(to_spj_verdict(exited(1)), spj_verdict::WRONG_ANSWER);
    EXPECT_EQ(to_spj_verdict(exited(2)), spj_verdict::ERROR);

    raw_outcome timeout = exited(0);
    timeout.cpu_time_exceeded = true;
    EXPECT_EQ(to_spj_verdict(timeout), spj_verdict::ERROR);

    raw_outcome crashed = exited(0);
    crashed.signal = SIGSEGV;
    EXPECT_EQ(to_spj_verdict(crashed), spj_verdict::ERROR);

    // 输出被截断的 special judge 即使返回 0 也不可信
    raw_outcome truncated = exited(0);
    truncated.output_truncated = true;
    EXPECT_EQ(to_spj_verdict(truncated), spj_verdict::ERROR);
}

TEST(ClassifierTest, DeterministicTest) {
    raw_outcome outcome = exited(0);
    string expected = "hello \nworld\n", actual = "hello\nworld";
    verdict first = classify(outcome, expected, actual, compare_mode::IGNORE_TRAILING_SPACE);
    verdict second = classify(outcome, expected, actual, compare_mode::IGNORE_TRAILING_SPACE);
    EXPECT_EQ(first.result, second.result);
    EXPECT_EQ(first.error, second.error);
    EXPECT_EQ(expected, "hello \nworld\n");
    EXPECT_EQ(actual, "hello\nworld");
}

TEST(ClassifierTest, NormalizeOutputTest) {
    EXPECT_EQ(normalize_output(""), "");
    EXPECT_EQ(normalize_output("\n\n"), "");
    EXPECT_EQ(normalize_output("a \t\r\nb\r\n\r\n"), "a\nb");
    EXPECT_EQ(normalize_output("  a"), "  a");
}
