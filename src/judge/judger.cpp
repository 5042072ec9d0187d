#include "judge/judger.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/trim.hpp>
#include <future>
#include "common/defer.hpp"
#include "common/digest.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "judge/classifier.hpp"
#include "judge/sandbox.hpp"

namespace judged {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

json execution_result::to_json() const {
    json j = {
        {"cpu_time", cpu_time},
        {"real_time", real_time},
        {"memory", memory},
        {"signal", signal},
        {"exit_code", exit_code},
        {"error", static_cast<int>(error)},
        {"result", static_cast<int>(result)},
        {"test_case", test_case},
        {"output_md5", output_md5}};
    if (output) j["output"] = *output;
    return j;
}

judger::judger(worker_pool &pool, spj_cache &cache)
    : pool(pool), cache(cache) {}

shared_ptr<spj_artifact> judger::prepare_spj(const judge_request &req, cancellation &token) {
    if (!req.uses_spj()) return nullptr;
    if (req.spj_src) {
        return pool.submit([&](const task_context &ctx) {
                       return judged::compile_spj(cache, *req.spj_src, *req.spj_version, *req.spj_compile, ctx, token);
                   })
            .get();
    }
    auto artifact = cache.find_version(*req.spj_version);
    if (!artifact)
        throw spj_compilation_error("spj not compiled");
    return artifact;
}

compile_artifact judger::prepare_executable(const judge_request &req, const fs::path &submission_dir, cancellation &token) {
    fs::path compile_dir = submission_dir / "compile";
    fs::create_directories(compile_dir);

    if (req.language.compile) {
        return pool.submit([&](const task_context &ctx) {
                       return judged::compile(req.src, *req.language.compile, compile_dir, ctx, token);
                   })
            .get();
    }

    // 解释型语言直接将源代码作为可执行文件，由评测服务端写入，运行用户只读
    compile_artifact artifact{compile_dir / req.language.run.exe_name, compile_dir};
    write_file_content(artifact.exe_path, req.src);
    fs::permissions(artifact.exe_path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                                           fs::perms::others_read | fs::perms::others_exec);
    return artifact;
}

execution_result judger::run_test_case(const judge_request &req, const test_case &tc, const compile_artifact &executable,
                                       const spj_artifact *spj, const fs::path &submission_dir,
                                       const task_context &ctx, cancellation &token) {
    execution_result result;
    result.test_case = tc.id;
    try {
        token.throw_if_cancelled();
        if (!fs::exists(executable.exe_path)) {
            LOG(ERROR) << "Executable " << executable.exe_path << " is missing";
            result.result = result_code::SYSTEM_ERROR;
            result.error = error_kind::ARTIFACT_MISSING;
            return result;
        }

        // case_dir 属于评测服务端，选手程序只能写入 sandbox 子目录，
        // 因此无法替换输入输出和 meta 文件
        fs::path case_dir = make_unique_directory(submission_dir);
        defer { remove_directory(case_dir); };
        fs::path sandbox_dir = make_owned_directory(case_dir / "sandbox", RUN_USER, RUN_GROUP);
        write_file_content(case_dir / "input", tc.input);

        map<string, string> values = {
            {"exe_path", executable.exe_path.string()},
            {"exe_dir", executable.exe_dir.string()},
            {"max_memory", to_string(req.max_memory / 1024)}};

        runguard_invocation inv = make_invocation(ctx);
        inv.command = req.language.run.command.substitute(values);
        inv.work_dir = sandbox_dir;
        inv.cpu_time_ms = req.max_cpu_time;
        inv.real_time_ms = req.max_cpu_time * REAL_TIME_FACTOR;
        inv.memory_bytes = req.max_memory;
        inv.memory_check_only = req.language.run.memory_limit_check_only;
        inv.syscall_profile = req.language.run.seccomp_rule;
        inv.env = req.language.run.env;
        inv.stream_size_bytes = OUTPUT_LIMIT;
        inv.stdin_file = case_dir / "input";
        inv.stdout_file = case_dir / "output";
        inv.stderr_file = case_dir / "error";
        inv.meta_file = case_dir / "program.meta";

        raw_outcome outcome = run_in_sandbox(inv, token);
        string actual = read_file_content(inv.stdout_file, "");

        verdict v;
        if (spj) {
            if (auto execution = classify_execution(outcome)) {
                v = *execution;
            } else {
                spj_files files{case_dir, inv.stdin_file, inv.stdout_file, case_dir / "answer"};
                write_file_content(files.answer, tc.output.value_or(""));
                v = classify(outcome, run_spj(*spj, *req.spj, files, req.max_cpu_time, ctx, token));
            }
        } else {
            v = classify(outcome, tc.output.value_or(""), actual, COMPARE_MODE);
        }

        result.cpu_time = outcome.cpu_time;
        result.real_time = outcome.real_time;
        result.memory = outcome.memory;
        result.signal = outcome.signal;
        result.exit_code = outcome.exit_code;
        result.result = v.result;
        result.error = v.error;
        result.output_md5 = md5_hex(boost::algorithm::trim_right_copy(actual));
        if (req.output) result.output = move(actual);
    } catch (judge_cancelled &) {
        throw;
    } catch (exception &e) {
        LOG(ERROR) << "Unable to judge test case " << tc.id << ": " << e.what();
        result.result = result_code::SYSTEM_ERROR;
        result.error = error_kind::SANDBOX_FAILED;
    }
    return result;
}

vector<execution_result> judger::judge(const judge_request &req, cancellation &token) {
    vector<test_case> provisioned;
    if (req.test_case_id)
        provisioned = load_test_cases(TEST_CASE_DIR / *req.test_case_id, !req.uses_spj());
    const vector<test_case> &test_cases = req.test_case_id ? provisioned : req.test_cases;

    auto spj = prepare_spj(req, token);

    fs::path submission_dir = make_unique_directory(RUN_DIR);
    defer { remove_directory(submission_dir); };
    // 运行用户可以进入但不能列出，不同测试点的目录互相不可见
    fs::permissions(submission_dir, fs::perms::owner_all | fs::perms::group_exec | fs::perms::others_exec);

    compile_artifact executable = prepare_executable(req, submission_dir, token);

    // 任务引用了本函数的局部变量，必须等待所有任务完成后才能离开
    vector<future<execution_result>> futures;
    auto wait_all = [&futures] {
        for (auto &f : futures) f.wait();
    };
    try {
        for (auto &tc : test_cases) {
            futures.push_back(pool.submit([&, tc_ptr = &tc](const task_context &ctx) {
                return run_test_case(req, *tc_ptr, executable, spj.get(), submission_dir, ctx, token);
            }));
        }
    } catch (...) {
        token.cancel();
        wait_all();
        throw;
    }
    wait_all();

    vector<execution_result> results;
    for (auto &f : futures)
        results.push_back(f.get());
    return results;
}

void judger::compile_spj(const compile_spj_request &req, cancellation &token) {
    pool.submit([&](const task_context &ctx) {
            return judged::compile_spj(cache, req.src, req.spj_version, req.config, ctx, token);
        })
        .get();
}

}  // namespace judged
