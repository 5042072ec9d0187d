#include "judge/sandbox.hpp"
#include <glog/logging.h>
#include <cmath>
#include <filesystem>
#include <system_error>
#include "common/utils.hpp"
#include "config.hpp"

namespace judged {
using namespace std;
namespace fs = std::filesystem;

static int64_t to_milliseconds(double seconds) {
    return seconds < 0 ? 0 : llround(seconds * 1000);
}

error_kind classify_internal_error(const string &message) {
    static const vector<pair<const char *, error_kind>> patterns = {
        {"unable to start command", error_kind::EXECVE_FAILED},
        {"setrlimit", error_kind::SETRLIMIT_FAILED},
        {"seccomp", error_kind::LOAD_SECCOMP_FAILED},
        {"set user id", error_kind::SETUID_FAILED},
        {"set group id", error_kind::SETUID_FAILED},
        {"redirecting", error_kind::DUP2_FAILED},
        {"unable to fork", error_kind::FORK_FAILED},
        {"waiting on child", error_kind::WAIT_FAILED}};
    // runguard 没有以 root 运行时无法切换到运行用户
    if (message.find("id: Operation not permitted") != string::npos)
        return error_kind::ROOT_REQUIRED;
    for (auto &[pattern, kind] : patterns)
        if (message.find(pattern) != string::npos)
            return kind;
    return error_kind::SANDBOX_FAILED;
}

raw_outcome to_raw_outcome(const runguard_result &result) {
    raw_outcome outcome;
    if (!result.internal_error.empty()) {
        outcome.engine_fault = classify_internal_error(result.internal_error);
        return outcome;
    }
    if (!result.complete) {
        outcome.engine_fault = error_kind::SANDBOX_FAILED;
        return outcome;
    }

    double cpu_time = result.cpu_time;
    if (cpu_time < 0 && result.user_time >= 0 && result.sys_time >= 0)
        cpu_time = result.user_time + result.sys_time;
    outcome.cpu_time = to_milliseconds(cpu_time);
    outcome.real_time = to_milliseconds(result.wall_time);
    outcome.memory = max<int64_t>(result.memory, 0);
    outcome.signal = result.signal;
    outcome.exit_code = result.exitcode;
    outcome.cpu_time_exceeded = !result.cpu_time_result.empty();
    outcome.real_time_exceeded = !result.wall_time_result.empty();
    outcome.memory_exceeded = !result.memory_result.empty();
    outcome.output_truncated = !result.output_truncated.empty();
    outcome.syscall_restricted = result.syscall_result == "restricted";
    return outcome;
}

runguard_invocation make_invocation(const task_context &ctx) {
    runguard_invocation inv;
    inv.user = RUN_USER;
    inv.group = RUN_GROUP;
    inv.cpuset = ctx.core_id;
    inv.nproc = PROCESS_LIMIT;
    inv.file_limit_bytes = FILE_LIMIT;
    return inv;
}

raw_outcome run_in_sandbox(const runguard_invocation &invocation, cancellation &token) {
    token.throw_if_cancelled();

    raw_outcome fault;
    fault.engine_fault = error_kind::SANDBOX_FAILED;

    error_code ec;
    fs::remove(invocation.meta_file, ec);

    pid_t runguard_pid = -1;
    try {
        int ret = run_runguard(invocation, [&](pid_t pid) {
            runguard_pid = pid;
            token.register_process(pid);
        });
        if (runguard_pid > 0) token.unregister_process(runguard_pid);
        DLOG(INFO) << "runguard exited with " << ret;
    } catch (system_error &e) {
        if (runguard_pid > 0) token.unregister_process(runguard_pid);
        LOG(ERROR) << "Unable to run runguard: " << e.what();
        return fault;
    }

    token.throw_if_cancelled();

    if (!fs::exists(invocation.meta_file)) {
        LOG(ERROR) << "runguard did not write " << invocation.meta_file;
        return fault;
    }
    runguard_result result = read_runguard_result(invocation.meta_file);
    if (!result.internal_error.empty())
        LOG(ERROR) << "runguard reported internal error: " << result.internal_error;
    return to_raw_outcome(result);
}

}  // namespace judged
