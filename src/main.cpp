#include <glog/logging.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <regex>
#include <set>
#include "common/io_utils.hpp"
#include "common/system.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/cancellation.hpp"
#include "judge/spj.hpp"
#include "server/auth.hpp"
#include "server/server.hpp"
#include "syscall_profile.hpp"
#include "worker.hpp"
using namespace std;
namespace po = boost::program_options;

struct cpuset {
    string literal;
    set<unsigned> ids;
};

void validate(boost::any& v, const vector<string>& values, cpuset*, int) {
    using namespace boost::program_options;
    static regex matcher("^([0-9]+)(-([0-9]+))?$");
    validators::check_first_occurrence(v);

    cpuset result;
    string const& s = validators::get_single_string(values);
    result.literal = s;
    vector<string> splitted;
    boost::split(splitted, s, boost::is_any_of(","));
    for (auto& token : splitted) {
        smatch matches;
        if (!regex_search(token, matches, matcher))
            throw validation_error(validation_error::invalid_option_value);
        if (matches[3].str().empty()) {
            result.ids.insert(boost::lexical_cast<unsigned>(matches[1].str()));
        } else {
            unsigned begin = boost::lexical_cast<unsigned>(matches[1].str());
            unsigned end = boost::lexical_cast<unsigned>(matches[3].str());
            if (begin > end)
                throw validation_error(validation_error::invalid_option_value);
            for (unsigned i = begin; i <= end; ++i)
                result.ids.insert(i);
        }
    }
    v = result;
}

/**
 * @brief 读取选项，命令行参数优先，其次是环境变量
 * @return 若命令行参数或者环境变量存在
 */
template <typename T>
bool read_option(const po::variables_map& vm, const char* name, const char* env, T& target) {
    if (vm.count(name)) {
        target = vm[name].as<T>();
        return true;
    } else if (env && getenv(env)) {
        try {
            target = boost::lexical_cast<T>(getenv(env));
        } catch (boost::bad_lexical_cast&) {
            LOG(FATAL) << "Environment variable " << env << " is malformed: " << getenv(env);
        }
        return true;
    }
    return false;
}

static void read_path_option(const po::variables_map& vm, const char* name, const char* env, filesystem::path& target) {
    string value;
    if (read_option(vm, name, env, value)) target = value;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    filesystem::path current(argv[0]);
    filesystem::path bin_dir(filesystem::weakly_canonical(current).parent_path());

    po::options_description desc("judged options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("address", po::value<string>()->default_value("0.0.0.0"), "set the address the HTTP server listens on")
        ("port", po::value<unsigned short>()->default_value(8080), "set the port the HTTP server listens on")
        ("token", po::value<string>(), "set the shared token, callers send its sha256 digest in X-Judge-Server-Token. You can either pass it from environ TOKEN")
        ("token-digest", po::value<string>(), "set the sha256 digest of the shared token directly. You can either pass it from environ TOKEN_DIGEST")
        ("cores", po::value<cpuset>(), "set the cores the judge server can make use of, such as 0-3,6, default to all online cores")
        ("runguard", po::value<string>(), "set the path of runguard executable. You can either pass it from environ RUNGUARD")
        ("run-dir", po::value<string>(), "set the directory to compile and run user programs, for ramdisk to speed up IO performance of user program. You can either pass it from environ RUNDIR")
        ("test-case-dir", po::value<string>(), "set the directory of provisioned test cases. You can either pass it from environ TESTCASEDIR")
        ("spj-dir", po::value<string>(), "set the directory to store compiled special judges. You can either pass it from environ SPJDIR")
        ("run-user", po::value<string>(), "set run user, default to nobody. You can either pass it from environ RUNUSER")
        ("run-group", po::value<string>(), "set run group, default to nogroup. You can either pass it from environ RUNGROUP")
        ("max-cpu-time-ceiling", po::value<int64_t>(), "set the maximum max_cpu_time in milliseconds a request can ask for, default to 10000. You can either pass it from environ MAXCPUTIME")
        ("max-memory-ceiling", po::value<int64_t>(), "set the maximum max_memory in bytes a request can ask for, default to 1073741824(1GB). You can either pass it from environ MAXMEMORY")
        ("max-compile-cpu-time-ceiling", po::value<int64_t>(), "set the maximum compile cpu time in milliseconds, default to 10000")
        ("max-compile-real-time-ceiling", po::value<int64_t>(), "set the maximum compile real time in milliseconds, default to 30000")
        ("max-compile-memory-ceiling", po::value<int64_t>(), "set the maximum compile memory in bytes, default to 1073741824(1GB)")
        ("real-time-factor", po::value<int>(), "set the ratio of real time limit to cpu time limit, default to 3. You can either pass it from environ REALTIMEFACTOR")
        ("max-output-size", po::value<int64_t>(), "set the maximum output size in bytes of user program, default to 16777216(16MB). You can either pass it from environ MAXOUTPUTSIZE")
        ("file-limit", po::value<int64_t>(), "set the maximum file size in bytes user program can create, default to 16777216(16MB)")
        ("nproc", po::value<size_t>(), "set the maximum number of processes user program can create, default to 64")
        ("spj-time-factor", po::value<int>(), "set the ratio of special judge cpu time limit to max_cpu_time, default to 3")
        ("spj-memory-limit", po::value<int64_t>(), "set the memory limit in bytes of special judge, default to 1073741824(1GB)")
        ("spj-cache-size", po::value<size_t>(), "set the maximum number of cached compiled special judges, default to 64. You can either pass it from environ SPJCACHESIZE")
        ("compare-mode", po::value<string>(), "set the output comparison, ignore-trailing-space (default) or exact")
        ("debug", "turn on the debug mode to disable checking whether it is in privileged mode, and not to delete run directory to check the validity of result files.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "judged: Sandboxed code judging server over HTTP" << endl
             << "This app requires root privilege" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "judged " << judged::VERSION << ", syscall profiles version " << SYSCALL_PROFILE_VERSION << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || getenv("DEBUG")) {
        judged::DEBUG = true;
    }

    if (getuid() != 0) {
        cerr << "You should run this program in privileged mode" << endl;
        if (!judged::DEBUG) return EXIT_FAILURE;
    }

    // 默认情况下，假设 runguard 与 judged 编译在同一个目录中
    judged::RUNGUARD = bin_dir / "runguard";
    read_path_option(vm, "runguard", "RUNGUARD", judged::RUNGUARD);
    CHECK(filesystem::is_regular_file(judged::RUNGUARD))
        << "runguard " << judged::RUNGUARD << " does not exist, specify it by --runguard or environ RUNGUARD";

    read_path_option(vm, "run-dir", "RUNDIR", judged::RUN_DIR);
    CHECK(filesystem::is_directory(judged::RUN_DIR))
        << "Run directory " << judged::RUN_DIR << " does not exist";

    read_path_option(vm, "test-case-dir", "TESTCASEDIR", judged::TEST_CASE_DIR);
    CHECK(filesystem::is_directory(judged::TEST_CASE_DIR))
        << "Test case directory " << judged::TEST_CASE_DIR << " does not exist";

    read_path_option(vm, "spj-dir", "SPJDIR", judged::SPJ_DIR);
    CHECK(filesystem::is_directory(judged::SPJ_DIR))
        << "Special judge directory " << judged::SPJ_DIR << " does not exist";

    read_option(vm, "run-user", "RUNUSER", judged::RUN_USER);
    read_option(vm, "run-group", "RUNGROUP", judged::RUN_GROUP);
    CHECK(get_userid(judged::RUN_USER.c_str()) >= 0) << "Run user " << judged::RUN_USER << " does not exist";
    CHECK(get_groupid(judged::RUN_GROUP.c_str()) >= 0) << "Run group " << judged::RUN_GROUP << " does not exist";

    string token;
    if (read_option(vm, "token-digest", "TOKEN_DIGEST", judged::TOKEN_DIGEST)) {
        boost::algorithm::to_lower(judged::TOKEN_DIGEST);
    } else if (read_option(vm, "token", "TOKEN", token)) {
        judged::TOKEN_DIGEST = judged::token_digest(token);
    }
    CHECK(!judged::TOKEN_DIGEST.empty())
        << "Token should be specified by --token, --token-digest or environ TOKEN, TOKEN_DIGEST";

    read_option(vm, "max-cpu-time-ceiling", "MAXCPUTIME", judged::MAX_CPU_TIME_CEILING);
    read_option(vm, "max-memory-ceiling", "MAXMEMORY", judged::MAX_MEMORY_CEILING);
    read_option(vm, "max-compile-cpu-time-ceiling", nullptr, judged::MAX_COMPILE_CPU_TIME_CEILING);
    read_option(vm, "max-compile-real-time-ceiling", nullptr, judged::MAX_COMPILE_REAL_TIME_CEILING);
    read_option(vm, "max-compile-memory-ceiling", nullptr, judged::MAX_COMPILE_MEMORY_CEILING);
    read_option(vm, "real-time-factor", "REALTIMEFACTOR", judged::REAL_TIME_FACTOR);
    read_option(vm, "max-output-size", "MAXOUTPUTSIZE", judged::OUTPUT_LIMIT);
    read_option(vm, "file-limit", nullptr, judged::FILE_LIMIT);
    read_option(vm, "nproc", nullptr, judged::PROCESS_LIMIT);
    read_option(vm, "spj-time-factor", nullptr, judged::SPJ_TIME_FACTOR);
    read_option(vm, "spj-memory-limit", nullptr, judged::SPJ_MEMORY_LIMIT);
    read_option(vm, "spj-cache-size", "SPJCACHESIZE", judged::SPJ_CACHE_SIZE);
    CHECK(judged::MAX_CPU_TIME_CEILING > 0 && judged::MAX_MEMORY_CEILING > 0) << "Ceilings should be positive";
    CHECK(judged::REAL_TIME_FACTOR > 0 && judged::SPJ_TIME_FACTOR > 0) << "Time factors should be positive";
    CHECK(judged::OUTPUT_LIMIT > 0) << "Maximum output size should be positive";

    string compare_mode = "ignore-trailing-space";
    read_option(vm, "compare-mode", "COMPAREMODE", compare_mode);
    if (compare_mode == "exact") {
        judged::COMPARE_MODE = judged::compare_mode::EXACT;
    } else if (compare_mode == "ignore-trailing-space") {
        judged::COMPARE_MODE = judged::compare_mode::IGNORE_TRAILING_SPACE;
    } else {
        LOG(FATAL) << "Unrecognized compare mode " << compare_mode;
    }

    // 让评测系统写入的数据只允许当前用户写入
    umask(0022);

    // 清理上次崩溃遗留的评测目录和 special judge
    judged::clear_directory(judged::RUN_DIR);
    judged::clear_directory(judged::SPJ_DIR);

    vector<size_t> cores;
    if (vm.count("cores")) {
        for (unsigned i : vm["cores"].as<cpuset>().ids)
            cores.push_back(i);
    } else {
        long online = sysconf(_SC_NPROCESSORS_ONLN);
        for (long i = 0; i < max(online, 1L); ++i)
            cores.push_back(i);
    }

    judged::cancellation_registry registry;
    judged::spj_cache spj_cache(judged::SPJ_DIR, judged::SPJ_CACHE_SIZE);
    judged::worker_pool pool(cores);
    judged::server::judge_server handler(pool, spj_cache, registry);

    try {
        judged::server::http_server server(handler, registry, vm["address"].as<string>(), vm["port"].as<unsigned short>());
        server.run();
    } catch (boost::system::system_error& e) {
        LOG(ERROR) << "HTTP server failed: " << e.what();
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
