#include "runguard.hpp"
#include <fmt/core.h>
#include <boost/lexical_cast.hpp>
#include <map>
#include <sstream>
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace judged {
using namespace std;

static map<string, string> read_metadata(const string &metadata) {
    map<string, string> mp;
    istringstream fin(metadata);
    string line;
    while (getline(fin, line)) {
        size_t end = line.find(": ");
        if (end == string::npos) {
            // 值为空时 runguard 写出 "key: "，某些编辑器会删去行末空格
            if (!line.empty() && line.back() == ':')
                mp[line.substr(0, line.size() - 1)] = "";
            continue;
        }
        mp[line.substr(0, end)] = line.substr(end + 2);
    }
    return mp;
}

template <typename T>
void try_to_parse(const map<string, string> &metadata, const string &key, T &value) {
    auto it = metadata.find(key);
    if (it == metadata.end()) return;
    try {
        value = boost::lexical_cast<T>(it->second);
    } catch (boost::bad_lexical_cast &) {
        // ignore malformed value
    }
}

template <>
void try_to_parse(const map<string, string> &metadata, const string &key, string &value) {
    auto it = metadata.find(key);
    if (it != metadata.end()) value = it->second;
}

runguard_result parse_runguard_result(const string &text) {
    auto metadata = read_metadata(text);
    runguard_result result;
    try_to_parse(metadata, "cpu-time", result.cpu_time);
    try_to_parse(metadata, "sys-time", result.sys_time);
    try_to_parse(metadata, "user-time", result.user_time);
    try_to_parse(metadata, "wall-time", result.wall_time);
    try_to_parse(metadata, "exitcode", result.exitcode);
    try_to_parse(metadata, "signal", result.signal);
    try_to_parse(metadata, "memory-bytes", result.memory);
    try_to_parse(metadata, "memory-result", result.memory_result);
    try_to_parse(metadata, "cpu-time-result", result.cpu_time_result);
    try_to_parse(metadata, "wall-time-result", result.wall_time_result);
    try_to_parse(metadata, "output-truncated", result.output_truncated);
    try_to_parse(metadata, "syscall-result", result.syscall_result);
    try_to_parse(metadata, "internal-error", result.internal_error);
    result.complete = metadata.count("exitcode") && metadata.count("cpu-time") && metadata.count("wall-time");
    return result;
}

runguard_result read_runguard_result(const filesystem::path &metafile) {
    return parse_runguard_result(read_file_content(metafile));
}

static string format_seconds(int64_t ms) {
    return fmt::format("{:.3f}", ms / 1000.0);
}

vector<string> runguard_arguments(const runguard_invocation &inv) {
    vector<string> args;
    if (!inv.user.empty()) args.insert(args.end(), {"--user", inv.user});
    if (!inv.group.empty()) args.insert(args.end(), {"--group", inv.group});
    if (!inv.work_dir.empty()) args.insert(args.end(), {"--work-dir", inv.work_dir.string()});
    if (inv.cpuset) args.insert(args.end(), {"--cpuset", to_string(*inv.cpuset)});
    if (inv.cpu_time_ms > 0) args.insert(args.end(), {"--cpu-time", format_seconds(inv.cpu_time_ms)});
    if (inv.real_time_ms > 0) args.insert(args.end(), {"--wall-time", format_seconds(inv.real_time_ms)});
    if (inv.memory_bytes > 0) {
        // runguard 的内存限制以 KB 为单位，向上取整
        args.insert(args.end(), {"--memory-limit", to_string((inv.memory_bytes + 1023) / 1024)});
        if (inv.memory_check_only) args.push_back("--memory-check-only");
    }
    if (inv.file_limit_bytes > 0) args.insert(args.end(), {"--file-limit", to_string((inv.file_limit_bytes + 1023) / 1024)});
    if (inv.stream_size_bytes >= 0) args.insert(args.end(), {"--stream-size", to_string(inv.stream_size_bytes)});
    if (inv.nproc > 0) args.insert(args.end(), {"--nproc", to_string(inv.nproc)});
    args.push_back("--no-core-dumps");
    if (!inv.syscall_profile.empty()) args.insert(args.end(), {"--syscall-profile", inv.syscall_profile});
    for (auto &var : inv.env) args.push_back("-V" + var);
    if (!inv.stdin_file.empty()) args.insert(args.end(), {"--standard-input-file", inv.stdin_file.string()});
    if (!inv.stdout_file.empty()) args.insert(args.end(), {"--standard-output-file", inv.stdout_file.string()});
    if (!inv.stderr_file.empty()) args.insert(args.end(), {"--standard-error-file", inv.stderr_file.string()});
    args.insert(args.end(), {"--out-meta", inv.meta_file.string()});
    args.push_back("--");
    args.insert(args.end(), inv.command.begin(), inv.command.end());
    return args;
}

int run_runguard(const runguard_invocation &invocation, const function<void(pid_t)> &on_spawn) {
    return call_process_env({}, on_spawn, RUNGUARD, runguard_arguments(invocation));
}

}  // namespace judged
