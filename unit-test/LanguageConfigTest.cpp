#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "config.hpp"
#include "judge/language.hpp"
#include "syscall_profile.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace judged;
using namespace nlohmann;

class LanguageConfigTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }
};

TEST_F(LanguageConfigTest, SubstituteTest) {
    auto command = command_template::parse("/usr/bin/g++ -O2 {src_path} -o {exe_path} -DMEM={max_memory}K", COMPILE_SLOTS);
    auto args = command.substitute({{"src_path", "/run/a b/main.cpp"},
                                    {"exe_path", "/run/a b/main"},
                                    {"exe_dir", "/run/a b"},
                                    {"max_memory", "262144"}});
    vector<string> expected = {"/usr/bin/g++", "-O2", "/run/a b/main.cpp", "-o", "/run/a b/main", "-DMEM=262144K"};
    EXPECT_EQ(args, expected);
    EXPECT_EQ(command.placeholders(), (set<string>{"src_path", "exe_path", "max_memory"}));
}

TEST_F(LanguageConfigTest, QuotedArgumentTest) {
    auto command = command_template::parse("/bin/sh -c \"cat {exe_path}\"", RUN_SLOTS);
    auto args = command.substitute({{"exe_path", "main.sh"}, {"exe_dir", "."}, {"max_memory", "1"}});
    vector<string> expected = {"/bin/sh", "-c", "cat main.sh"};
    EXPECT_EQ(args, expected);
}

TEST_F(LanguageConfigTest, UnknownPlaceholderTest) {
    EXPECT_THROW(command_template::parse("/usr/bin/python3 {src_path}", RUN_SLOTS), invalid_request);
    EXPECT_THROW(command_template::parse("{exe_path} {answer_file_path}", RUN_SLOTS), invalid_request);
    EXPECT_NO_THROW(command_template::parse("{exe_path} {answer_file_path}", SPJ_SLOTS));
}

TEST_F(LanguageConfigTest, UnbalancedBraceTest) {
    EXPECT_THROW(command_template::parse("{exe_path", RUN_SLOTS), invalid_request);
    EXPECT_THROW(command_template::parse("exe_path}", RUN_SLOTS), invalid_request);
    EXPECT_THROW(command_template::parse("{{exe_path}}", RUN_SLOTS), invalid_request);
    EXPECT_THROW(command_template::parse("", RUN_SLOTS), invalid_request);
    EXPECT_THROW(command_template::parse("   ", RUN_SLOTS), invalid_request);
}

TEST_F(LanguageConfigTest, CompileConfigTest) {
    json j = {
        {"src_name", "main.cpp"},
        {"exe_name", "main"},
        {"max_cpu_time", 3000},
        {"max_real_time", 5000},
        {"max_memory", 134217728},
        {"compile_command", "/usr/bin/g++ {src_path} -o {exe_path}"}};
    compile_config config = compile_config::parse(j);
    EXPECT_EQ(config.src_name, "main.cpp");
    EXPECT_EQ(config.exe_name, "main");
    EXPECT_EQ(config.max_cpu_time, 3000);
    EXPECT_EQ(config.max_real_time, 5000);
    EXPECT_EQ(config.max_memory, 134217728);

    json negative = j;
    negative["max_cpu_time"] = -1;
    EXPECT_THROW(compile_config::parse(negative), invalid_request);

    json too_large = j;
    too_large["max_real_time"] = MAX_COMPILE_REAL_TIME_CEILING + 1;
    EXPECT_THROW(compile_config::parse(too_large), invalid_request);

    json unsafe = j;
    unsafe["src_name"] = "../main.cpp";
    EXPECT_THROW(compile_config::parse(unsafe), invalid_request);

    json missing = j;
    missing.erase("compile_command");
    EXPECT_THROW(compile_config::parse(missing), invalid_request);
}

TEST_F(LanguageConfigTest, RunConfigTest) {
    json j = {
        {"command", "/usr/bin/java -cp {exe_dir} -XX:MaxRAM={max_memory}k Main"},
        {"seccomp_rule", nullptr},
        {"env", {"LANG=en_US.UTF-8", "LC_ALL=en_US.UTF-8"}},
        {"memory_limit_check_only", 1}};
    run_config config = run_config::parse(j);
    EXPECT_EQ(config.seccomp_rule, "");
    EXPECT_EQ(config.env.size(), 2u);
    EXPECT_TRUE(config.memory_limit_check_only);
    EXPECT_EQ(config.exe_name, "main");

    j["seccomp_rule"] = "c_cpp";
    j["exe_name"] = "solution.py";
    config = run_config::parse(j);
    EXPECT_EQ(config.seccomp_rule, "c_cpp");
    EXPECT_EQ(config.exe_name, "solution.py");

    j["seccomp_rule"] = "python";
    EXPECT_THROW(run_config::parse(j), invalid_request);

    j["seccomp_rule"] = "general";
    j["env"] = {"NO_EQUALS_SIGN"};
    EXPECT_THROW(run_config::parse(j), invalid_request);
}

TEST_F(LanguageConfigTest, LanguageConfigTest) {
    json interpreted = {{"run", {{"command", "/usr/bin/python3 {exe_path}"}, {"seccomp_rule", "general"}}}};
    language_config config = language_config::parse(interpreted);
    EXPECT_FALSE(config.compile.has_value());
    EXPECT_EQ(config.run.seccomp_rule, "general");

    EXPECT_THROW(language_config::parse(json::object()), invalid_request);
    EXPECT_THROW(language_config::parse("cpp"), invalid_request);
}

TEST_F(LanguageConfigTest, SpjVersionTest) {
    EXPECT_EQ(expand_spj_version("spj-{spj_version}.c", "1a2b"), "spj-1a2b.c");
    EXPECT_EQ(expand_spj_version("spj", "1a2b"), "spj");
}

TEST_F(LanguageConfigTest, SyscallProfileTest) {
    EXPECT_TRUE(is_known_syscall_profile(""));
    for (auto &profile : syscall_profiles())
        EXPECT_TRUE(is_known_syscall_profile(profile.name));
    EXPECT_FALSE(is_known_syscall_profile("c_cpp "));
    EXPECT_FALSE(is_known_syscall_profile("unrestricted"));
    EXPECT_EQ(syscall_profiles().size(), 5u);
}
