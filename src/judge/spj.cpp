#include "judge/spj.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/defer.hpp"
#include "common/digest.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "judge/sandbox.hpp"

namespace judged {
using namespace std;
namespace fs = std::filesystem;

spj_artifact::spj_artifact(const string &hash, const string &version, const fs::path &dir, const compile_artifact &artifact)
    : hash(hash), version(version), dir(dir), artifact(artifact) {}

spj_artifact::~spj_artifact() {
    remove_directory(dir);
}

spj_cache::spj_cache(const fs::path &root, size_t capacity)
    : root(root), capacity(max<size_t>(capacity, 1)) {}

shared_ptr<spj_artifact> spj_cache::find(const string &hash, const string &version) {
    lock_guard<mutex> guard(mut);
    for (auto it = entries.begin(); it != entries.end(); ++it) {
        if ((*it)->hash == hash && (*it)->version == version) {
            entries.splice(entries.begin(), entries, it);
            return entries.front();
        }
    }
    return nullptr;
}

shared_ptr<spj_artifact> spj_cache::find_version(const string &version) {
    lock_guard<mutex> guard(mut);
    for (auto it = entries.begin(); it != entries.end(); ++it) {
        if ((*it)->version == version) {
            entries.splice(entries.begin(), entries, it);
            return entries.front();
        }
    }
    return nullptr;
}

void spj_cache::insert(const shared_ptr<spj_artifact> &artifact) {
    lock_guard<mutex> guard(mut);
    entries.remove_if([&](const shared_ptr<spj_artifact> &entry) {
        return entry->version == artifact->version || entry->hash == artifact->hash;
    });
    entries.push_front(artifact);
    while (entries.size() > capacity) {
        LOG(INFO) << "Evicting special judge " << entries.back()->version;
        entries.pop_back();
    }
}

fs::path spj_cache::next_directory(const string &hash, const string &version) {
    lock_guard<mutex> guard(mut);
    return root / fmt::format("{}-{}-{}", version, hash.substr(0, 16), ++sequence);
}

size_t spj_cache::size() const {
    lock_guard<mutex> guard(mut);
    return entries.size();
}

shared_ptr<spj_artifact> compile_spj(spj_cache &cache, const string &src, const string &version,
                                     const compile_config &config, const task_context &ctx, cancellation &token) {
    string hash = sha256_hex(src);
    lock_guard<mutex> guard(cache.compile_mutex);
    if (auto artifact = cache.find(hash, version)) return artifact;

    compile_config spj_compile = config;
    spj_compile.src_name = assert_safe_path(expand_spj_version(config.src_name, version));
    spj_compile.exe_name = assert_safe_path(expand_spj_version(config.exe_name, version));

    fs::path dir = cache.next_directory(hash, version);
    fs::create_directories(dir);
    scoped_guard cleanup([&] { remove_directory(dir); });

    LOG(INFO) << "Compiling special judge " << version << " in " << dir;
    compile_artifact artifact;
    try {
        artifact = compile(src, spj_compile, dir, ctx, token);
    } catch (compilation_error &e) {
        throw spj_compilation_error(e.what());
    }
    seal_directory(dir);

    auto result = make_shared<spj_artifact>(hash, version, dir, artifact);
    cleanup.dismiss();
    cache.insert(result);
    return result;
}

spj_verdict run_spj(const spj_artifact &spj, const spj_config &config, const spj_files &files,
                    int64_t max_cpu_time, const task_context &ctx, cancellation &token) {
    map<string, string> values = {
        {"exe_path", spj.artifact.exe_path.string()},
        {"exe_dir", spj.artifact.exe_dir.string()},
        {"max_memory", to_string(SPJ_MEMORY_LIMIT / 1024)},
        {"in_file_path", files.input.string()},
        {"user_out_file_path", files.user_output.string()},
        {"answer_file_path", files.answer.string()}};

    runguard_invocation inv = make_invocation(ctx);
    inv.command = config.command.substitute(values);
    inv.work_dir = make_owned_directory(files.work_dir / "spj", RUN_USER, RUN_GROUP);
    inv.cpu_time_ms = max_cpu_time * SPJ_TIME_FACTOR;
    inv.real_time_ms = inv.cpu_time_ms * REAL_TIME_FACTOR;
    inv.memory_bytes = SPJ_MEMORY_LIMIT;
    inv.syscall_profile = config.seccomp_rule;
    inv.stream_size_bytes = OUTPUT_LIMIT;
    inv.stdin_file = files.input;
    inv.stdout_file = files.work_dir / "spj.out";
    inv.stderr_file = files.work_dir / "spj.err";
    inv.meta_file = files.work_dir / "spj.meta";

    raw_outcome outcome = run_in_sandbox(inv, token);
    spj_verdict verdict = to_spj_verdict(outcome);
    if (verdict == spj_verdict::ERROR)
        LOG(WARNING) << "Special judge " << spj.version << " failed in " << files.work_dir
                     << ", exit code " << outcome.exit_code << ", signal " << outcome.signal;
    return verdict;
}

}  // namespace judged
