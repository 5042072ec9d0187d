#include <fcntl.h>
#include <unistd.h>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <future>
#include <thread>
#include "gtest/gtest.h"
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "config.hpp"
#include "judge/judger.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace judged;
using namespace nlohmann;

/**
 * 需要 root 权限和编译好的 runguard，在沙箱中编译并运行 C 程序
 */
class SandboxJudgeTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }

    SandboxJudgeTest() : pool({0}), cache(SPJ_DIR, 4), judge(pool, cache) {}

    void SetUp() override {
        if (!sandbox_available()) GTEST_SKIP() << "runguard is not available or not running as root";
    }

    static json c_compile_config(const string &src_name, const string &exe_name) {
        return {
            {"src_name", src_name},
            {"exe_name", exe_name},
            {"max_cpu_time", 5000},
            {"max_real_time", 10000},
            {"max_memory", 536870912},
            {"compile_command", "/usr/bin/gcc -O2 -w -std=c99 {src_path} -lm -o {exe_path}"}};
    }

    static json c_request(const string &src) {
        return {
            {"src", src},
            {"language_config", {
                {"compile", c_compile_config("main.c", "main")},
                {"run", {{"command", "{exe_path}"}, {"seccomp_rule", "c_cpp"}}}}},
            {"max_cpu_time", 1000},
            {"max_memory", 134217728},
            {"test_case", {{{"input", "1 2\n"}, {"output", "3\n"}}, {{"input", "10 20\n"}, {"output", "30\n"}}}}};
    }

    vector<execution_result> run(const json &j) {
        cancellation token;
        return judge.judge(parse_judge_request(j), token);
    }

    worker_pool pool;
    spj_cache cache;
    judger judge;
};

static const char *APLUSB = R"(#include <stdio.h>
int main() { int a, b; scanf("%d%d", &a, &b); printf("%d\n", a + b); return 0; })";

TEST_F(SandboxJudgeTest, AcceptedTest) {
    json j = c_request(APLUSB);
    j["output"] = true;
    auto results = run(j);
    ASSERT_EQ(results.size(), 2u);
    for (auto &r : results) {
        EXPECT_EQ(r.result, result_code::SUCCESS) << r.to_json().dump();
        EXPECT_EQ(r.error, error_kind::SUCCESS);
        EXPECT_EQ(r.exit_code, 0);
        EXPECT_GT(r.memory, 0);
    }
    EXPECT_EQ(results[0].test_case, "1");
    EXPECT_EQ(results[1].output, "30\n");
    // md5("3")
    EXPECT_EQ(results[0].output_md5, "eccbc87e4b5ce2fe28308fd9f2a7baf3");
    if (!DEBUG) EXPECT_TRUE(filesystem::is_empty(RUN_DIR));
}

TEST_F(SandboxJudgeTest, WrongAnswerTest) {
    auto results = run(c_request(R"(#include <stdio.h>
int main() { int a, b; scanf("%d%d", &a, &b); printf("%d\n", a - b); return 0; })"));
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].result, result_code::WRONG_ANSWER);
    EXPECT_FALSE(results[0].output.has_value());
}

TEST_F(SandboxJudgeTest, CpuTimeLimitExceededTest) {
    auto results = run(c_request("int main() { volatile unsigned long i = 0; while (1) ++i; }"));
    for (auto &r : results) {
        EXPECT_EQ(r.result, result_code::CPU_TIME_LIMIT_EXCEEDED);
        EXPECT_GE(r.cpu_time, 1000);
    }
}

TEST_F(SandboxJudgeTest, RealTimeLimitExceededTest) {
    // c_cpp 规则不允许 nanosleep
    json j = c_request("#include <unistd.h>\nint main() { sleep(10); return 0; }");
    j["language_config"]["run"]["seccomp_rule"] = nullptr;
    auto results = run(j);
    for (auto &r : results)
        EXPECT_EQ(r.result, result_code::REAL_TIME_LIMIT_EXCEEDED);
}

TEST_F(SandboxJudgeTest, MemoryLimitExceededTest) {
    auto results = run(c_request(R"(#include <stdlib.h>
#include <string.h>
int main() { for (int i = 0; i < 64; ++i) { char *p = malloc(16 << 20); memset(p, 1, 16 << 20); } return 0; })"));
    for (auto &r : results)
        EXPECT_EQ(r.result, result_code::MEMORY_LIMIT_EXCEEDED);
}

TEST_F(SandboxJudgeTest, RuntimeErrorTest) {
    auto results = run(c_request(R"(#include <stdio.h>
int main() { int a, b; scanf("%d%d", &a, &b); printf("%d\n", a / (b - b)); return 0; })"));
    for (auto &r : results) {
        EXPECT_EQ(r.result, result_code::RUNTIME_ERROR);
        EXPECT_EQ(r.signal, SIGFPE);
    }

    results = run(c_request("int main() { return 3; }"));
    for (auto &r : results) {
        EXPECT_EQ(r.result, result_code::RUNTIME_ERROR);
        EXPECT_EQ(r.exit_code, 3);
    }
}

TEST_F(SandboxJudgeTest, CompileErrorTest) {
    EXPECT_THROW(run(c_request("int main() { return undefined_symbol; }")), compilation_error);
    if (!DEBUG) EXPECT_TRUE(filesystem::is_empty(RUN_DIR));
}

TEST_F(SandboxJudgeTest, SpecialJudgeTest) {
    // 输出与输入之和相同时通过
    string spj_src = R"(#include <stdio.h>
int main(int argc, char *argv[]) {
    FILE *in = fopen(argv[1], "r"), *out = fopen(argv[2], "r");
    int a, b, c;
    if (fscanf(in, "%d%d", &a, &b) != 2) return 255;
    if (fscanf(out, "%d", &c) != 1) return 1;
    return a + b == c ? 0 : 1;
})";
    {
        cancellation token;
        compile_spj_request req;
        req.src = spj_src;
        req.spj_version = "1";
        req.config = compile_config::parse(c_compile_config("spj-{spj_version}.c", "spj-{spj_version}"));
        judge.compile_spj(req, token);
    }
    EXPECT_EQ(cache.size(), 1u);

    json j = c_request(APLUSB);
    j["spj_version"] = "1";
    j["spj_config"] = {
        {"exe_name", "spj-{spj_version}"},
        {"command", "{exe_path} {in_file_path} {user_out_file_path}"},
        {"seccomp_rule", "c_cpp"}};
    j["test_case"] = {{{"input", "1 2\n"}}, {{"input", "5 6\n"}}};
    for (auto &r : run(j))
        EXPECT_EQ(r.result, result_code::SUCCESS) << r.to_json().dump();

    // spj 返回值不是 0 或 1 时为系统错误
    j["test_case"] = {{{"input", "not numbers\n"}}};
    auto results = run(j);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].result, result_code::SYSTEM_ERROR);
    EXPECT_EQ(results[0].error, error_kind::SPJ_ERROR);
}

TEST_F(SandboxJudgeTest, SandboxDirectoryTest) {
    // 程序只能写入自己的工作目录，不能替换输出和 meta 文件，也不能删除可执行文件
    json j = c_request(R"(#define _DEFAULT_SOURCE
#include <fcntl.h>
#include <stdio.h>
#include <unistd.h>
int main() {
    int a, b, breached = 0;
    char exe[4096];
    ssize_t len;
    scanf("%d%d", &a, &b);
    unlink("../output");
    unlink("../program.meta");
    if (symlink("/etc/passwd", "../output") == 0) breached = 1;
    if (symlink("/etc/passwd", "../program.meta") == 0) breached = 1;
    if (open("../forged", O_WRONLY | O_CREAT, 0644) >= 0) breached = 1;
    if (open("scratch", O_WRONLY | O_CREAT, 0644) < 0) breached = 1;
    if ((len = readlink("/proc/self/exe", exe, sizeof(exe) - 1)) > 0) {
        exe[len] = 0;
        if (unlink(exe) == 0) breached = 1;
    }
    printf("%d\n", breached ? 0 : a + b);
    return 0;
})");
    j["language_config"]["run"]["seccomp_rule"] = nullptr;
    j["output"] = true;
    auto results = run(j);
    ASSERT_EQ(results.size(), 2u);
    for (auto &r : results)
        EXPECT_EQ(r.result, result_code::SUCCESS) << r.to_json().dump();
    EXPECT_EQ(results[0].output, "3\n");
    EXPECT_EQ(results[1].output, "30\n");
    if (!DEBUG) EXPECT_TRUE(filesystem::is_empty(RUN_DIR));
}

TEST_F(SandboxJudgeTest, InheritedDescriptorsTest) {
    // 评测服务端自己打开的文件描述符不会进入沙箱
    int leaked = open("/dev/null", O_RDONLY);
    ASSERT_GE(leaked, 3);
    json j = c_request(R"(#include <fcntl.h>
#include <stdio.h>
int main() {
    int n = 0;
    for (int fd = 3; fd < 1024; ++fd)
        if (fcntl(fd, F_GETFD) != -1) ++n;
    printf("%d\n", n);
    return 0;
})");
    j["language_config"]["run"]["seccomp_rule"] = nullptr;
    j["test_case"] = {{{"input", ""}, {"output", "0\n"}}};
    j["output"] = true;
    auto results = run(j);
    close(leaked);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].result, result_code::SUCCESS) << results[0].to_json().dump();
}

TEST_F(SandboxJudgeTest, SyscallRestrictedTest) {
    auto results = run(c_request(R"(#include <sys/socket.h>
int main() { socket(AF_INET, SOCK_STREAM, 0); return 0; })"));
    for (auto &r : results) {
        EXPECT_EQ(r.result, result_code::RUNTIME_ERROR);
        EXPECT_EQ(r.error, error_kind::SYSCALL_RESTRICTED);
        EXPECT_EQ(r.signal, SIGSYS);
    }
}

TEST_F(SandboxJudgeTest, OutputLimitExceededTest) {
    int64_t saved = OUTPUT_LIMIT;
    OUTPUT_LIMIT = 1 << 20;
    defer { OUTPUT_LIMIT = saved; };
    auto results = run(c_request(R"(#include <stdio.h>
#include <string.h>
int main() {
    static char line[4096];
    memset(line, 'a', sizeof(line));
    for (int i = 0; i < 1024; ++i) fwrite(line, 1, sizeof(line), stdout);
    return 0;
})"));
    for (auto &r : results) {
        EXPECT_EQ(r.result, result_code::RUNTIME_ERROR) << r.to_json().dump();
        EXPECT_EQ(r.error, error_kind::OUTPUT_LIMIT_EXCEEDED);
    }
}

TEST_F(SandboxJudgeTest, MemoryCheckOnlyTest) {
    // 只检查内存峰值时程序可以正常结束，但结果仍然是超出内存限制
    json j = c_request(R"(#include <stdlib.h>
#include <string.h>
int main() { char *p = malloc(256 << 20); memset(p, 1, 256 << 20); return p[12345] - 1; })");
    j["language_config"]["run"]["memory_limit_check_only"] = true;
    for (auto &r : run(j)) {
        EXPECT_EQ(r.result, result_code::MEMORY_LIMIT_EXCEEDED) << r.to_json().dump();
        EXPECT_EQ(r.exit_code, 0);
    }
}

/**
 * @brief RUN_DIR 中是否有测试点正在运行
 */
static bool test_case_running() {
    // 目录可能在遍历时被删除
    error_code ec;
    for (filesystem::recursive_directory_iterator it(RUN_DIR, ec), end; !ec && it != end; it.increment(ec))
        if (it->path().filename() == "sandbox") return true;
    return false;
}

TEST_F(SandboxJudgeTest, CancelRunningTest) {
    json j = c_request("#include <unistd.h>\nint main() { sleep(30); return 0; }");
    j["language_config"]["run"]["seccomp_rule"] = nullptr;
    j["max_cpu_time"] = 20000;
    j["test_case"] = {{{"input", ""}, {"output", ""}}};
    judge_request req = parse_judge_request(j);

    cancellation token;
    auto judging = async(launch::async, [&] { return judge.judge(req, token); });

    auto deadline = chrono::steady_clock::now() + chrono::seconds(20);
    while (!test_case_running() && chrono::steady_clock::now() < deadline)
        this_thread::sleep_for(chrono::milliseconds(20));
    ASSERT_TRUE(test_case_running());
    this_thread::sleep_for(chrono::milliseconds(200));

    auto cancelled_at = chrono::steady_clock::now();
    token.cancel();
    ASSERT_EQ(judging.wait_for(chrono::seconds(5)), future_status::ready);
    EXPECT_THROW(judging.get(), judge_cancelled);
    EXPECT_LT(chrono::steady_clock::now() - cancelled_at, chrono::seconds(5));
    if (!DEBUG) EXPECT_TRUE(filesystem::is_empty(RUN_DIR));
}
