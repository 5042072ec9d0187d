#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "config.hpp"
#include "judge/request.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace judged;
using namespace nlohmann;

class RequestTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }

    json cpp_request() {
        return {
            {"src", "#include <cstdio>\nint main() { int a, b; scanf(\"%d%d\", &a, &b); printf(\"%d\\n\", a + b); }"},
            {"language_config", {
                {"compile", {
                    {"src_name", "main.c"},
                    {"exe_name", "main"},
                    {"max_cpu_time", 3000},
                    {"max_real_time", 10000},
                    {"max_memory", 268435456},
                    {"compile_command", "/usr/bin/gcc -O2 -w -std=c99 {src_path} -lm -o {exe_path}"}}},
                {"run", {
                    {"command", "{exe_path}"},
                    {"seccomp_rule", "c_cpp"},
                    {"env", {"LANG=en_US.UTF-8"}}}}}},
            {"max_cpu_time", 1000},
            {"max_memory", 134217728},
            {"test_case", {{{"input", "1 2\n"}, {"output", "3\n"}}, {{"input", "3 4\n"}, {"output", "7\n"}}}}};
    }
};

TEST_F(RequestTest, InlineTestCaseTest) {
    judge_request req = parse_judge_request(cpp_request());
    EXPECT_EQ(req.max_cpu_time, 1000);
    EXPECT_EQ(req.max_memory, 134217728);
    EXPECT_FALSE(req.test_case_id.has_value());
    ASSERT_EQ(req.test_cases.size(), 2u);
    EXPECT_EQ(req.test_cases[0].id, "1");
    EXPECT_EQ(req.test_cases[1].id, "2");
    EXPECT_EQ(req.test_cases[1].input, "3 4\n");
    EXPECT_EQ(req.test_cases[1].output, "7\n");
    EXPECT_FALSE(req.output);
    EXPECT_FALSE(req.uses_spj());
    EXPECT_TRUE(req.language.compile.has_value());
}

TEST_F(RequestTest, TestCaseIdTest) {
    json j = cpp_request();
    j.erase("test_case");
    j["test_case_id"] = "a9f3";
    j["output"] = true;
    judge_request req = parse_judge_request(j);
    EXPECT_EQ(req.test_case_id, "a9f3");
    EXPECT_TRUE(req.test_cases.empty());
    EXPECT_TRUE(req.output);
}

TEST_F(RequestTest, ExactlyOneTestCaseSourceTest) {
    json both = cpp_request();
    both["test_case_id"] = "a9f3";
    EXPECT_THROW(parse_judge_request(both), invalid_request);

    json neither = cpp_request();
    neither.erase("test_case");
    EXPECT_THROW(parse_judge_request(neither), invalid_request);

    json null_id = cpp_request();
    null_id["test_case_id"] = nullptr;
    EXPECT_NO_THROW(parse_judge_request(null_id));
}

TEST_F(RequestTest, UnsafeTestCaseIdTest) {
    json j = cpp_request();
    j.erase("test_case");
    j["test_case_id"] = "../../etc";
    EXPECT_THROW(parse_judge_request(j), invalid_request);
}

TEST_F(RequestTest, LimitTest) {
    json zero = cpp_request();
    zero["max_cpu_time"] = 0;
    EXPECT_THROW(parse_judge_request(zero), invalid_request);

    json fractional = cpp_request();
    fractional["max_memory"] = 1.5;
    EXPECT_THROW(parse_judge_request(fractional), invalid_request);

    json text = cpp_request();
    text["max_memory"] = "134217728";
    EXPECT_THROW(parse_judge_request(text), invalid_request);

    json too_large = cpp_request();
    too_large["max_cpu_time"] = MAX_CPU_TIME_CEILING + 1;
    EXPECT_THROW(parse_judge_request(too_large), invalid_request);
}

TEST_F(RequestTest, MalformedRequestTest) {
    EXPECT_THROW(parse_judge_request(json::array()), invalid_request);

    json no_src = cpp_request();
    no_src.erase("src");
    EXPECT_THROW(parse_judge_request(no_src), invalid_request);

    json no_run = cpp_request();
    no_run["language_config"].erase("run");
    EXPECT_THROW(parse_judge_request(no_run), invalid_request);

    json bad_placeholder = cpp_request();
    bad_placeholder["language_config"]["run"]["command"] = "{exe_path} {src_path}";
    EXPECT_THROW(parse_judge_request(bad_placeholder), invalid_request);

    json no_output = cpp_request();
    no_output["test_case"][0].erase("output");
    EXPECT_THROW(parse_judge_request(no_output), invalid_request);
}

TEST_F(RequestTest, SpecialJudgeTest) {
    json j = cpp_request();
    j["spj_version"] = "1";
    EXPECT_THROW(parse_judge_request(j), invalid_request);

    j["spj_config"] = {{"exe_name", "spj-{spj_version}"}, {"command", "{exe_path} {in_file_path} {user_out_file_path}"}, {"seccomp_rule", "c_cpp"}};
    // 使用 special judge 时测试数据可以没有标准输出
    j["test_case"][0].erase("output");
    judge_request req = parse_judge_request(j);
    EXPECT_TRUE(req.uses_spj());
    EXPECT_EQ(req.spj_version, "1");
    EXPECT_FALSE(req.test_cases[0].output.has_value());
    EXPECT_FALSE(req.spj_src.has_value());

    j["spj_src"] = "int main() { return 0; }";
    EXPECT_THROW(parse_judge_request(j), invalid_request);

    j["spj_compile_config"] = {
        {"src_name", "spj-{spj_version}.c"},
        {"exe_name", "spj-{spj_version}"},
        {"max_cpu_time", 3000},
        {"max_real_time", 5000},
        {"max_memory", 1073741824},
        {"compile_command", "/usr/bin/gcc {src_path} -o {exe_path}"}};
    req = parse_judge_request(j);
    EXPECT_TRUE(req.spj_src.has_value());
    EXPECT_TRUE(req.spj_compile.has_value());

    j["spj_version"] = "../1";
    EXPECT_THROW(parse_judge_request(j), invalid_request);
}

TEST_F(RequestTest, CompileSpjRequestTest) {
    json j = {
        {"src", "int main() { return 0; }"},
        {"spj_version", "2"},
        {"spj_compile_config", {
            {"src_name", "spj-{spj_version}.c"},
            {"exe_name", "spj-{spj_version}"},
            {"max_cpu_time", 3000},
            {"max_real_time", 5000},
            {"max_memory", 1073741824},
            {"compile_command", "/usr/bin/gcc {src_path} -o {exe_path}"}}}};
    compile_spj_request req = parse_compile_spj_request(j);
    EXPECT_EQ(req.spj_version, "2");
    EXPECT_EQ(req.config.src_name, "spj-{spj_version}.c");

    j.erase("spj_version");
    EXPECT_THROW(parse_compile_spj_request(j), invalid_request);
}
