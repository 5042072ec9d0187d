#include "judge/compiler.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/status.hpp"
#include "config.hpp"
#include "judge/sandbox.hpp"

namespace judged {
using namespace std;
namespace fs = std::filesystem;

/**
 * @brief 读取编译器的输出，输出为空时根据运行情况给出固定的错误信息
 */
static string compiler_message(const fs::path &workdir, const raw_outcome &outcome) {
    string message = read_file_content(workdir / "compile.out", "") + read_file_content(workdir / "compile.err", "");
    if (!message.empty()) return message;
    if (outcome.cpu_time_exceeded || outcome.real_time_exceeded)
        return "Compiler time limit exceeded";
    if (outcome.memory_exceeded)
        return "Compiler memory limit exceeded";
    if (outcome.signal != 0)
        return "Compiler killed by signal " + to_string(outcome.signal);
    if (outcome.exit_code != 0)
        return "Compiler exited with code " + to_string(outcome.exit_code);
    return "Compiler produced no executable";
}

compile_artifact compile(const string &source, const compile_config &config,
                         const fs::path &workdir, const task_context &ctx, cancellation &token) {
    // 编译器以运行用户的身份运行，只能写入 build 子目录，编译输出和 meta 文件留在 workdir 中
    fs::path build_dir = make_owned_directory(workdir / "build", RUN_USER, RUN_GROUP);
    fs::path src_path = build_dir / config.src_name;
    compile_artifact artifact{build_dir / config.exe_name, build_dir};
    write_file_content(src_path, source);

    map<string, string> values = {
        {"src_path", src_path.string()},
        {"exe_path", artifact.exe_path.string()},
        {"exe_dir", artifact.exe_dir.string()},
        {"max_memory", to_string(config.max_memory / 1024)}};

    runguard_invocation inv = make_invocation(ctx);
    inv.command = config.compile_command.substitute(values);
    inv.work_dir = build_dir;
    inv.cpu_time_ms = config.max_cpu_time;
    inv.real_time_ms = config.max_real_time;
    inv.memory_bytes = config.max_memory;
    inv.stream_size_bytes = COMPILE_OUTPUT_LIMIT;
    inv.stdin_file = "/dev/null";
    inv.stdout_file = workdir / "compile.out";
    inv.stderr_file = workdir / "compile.err";
    inv.meta_file = workdir / "compile.meta";

    raw_outcome outcome = run_in_sandbox(inv, token);
    if (outcome.engine_fault)
        throw internal_error(fmt::format("unable to run compiler: {}", get_display_message(*outcome.engine_fault)));

    // 选手程序运行前收回编译产物的所有权，可执行文件不能是指向别处的符号链接
    seal_directory(build_dir);
    bool failed = outcome.cpu_time_exceeded || outcome.real_time_exceeded || outcome.memory_exceeded ||
                  outcome.signal != 0 || outcome.exit_code != 0 ||
                  !fs::is_regular_file(fs::symlink_status(artifact.exe_path));
    if (failed) {
        string message = compiler_message(workdir, outcome);
        LOG(INFO) << "Compilation failed in " << workdir;
        throw compilation_error(message);
    }
    return artifact;
}

}  // namespace judged
