#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <cmath>
#include <iostream>
#include "common/system.hpp"
#include "run.hpp"
#include "syscall_profile.hpp"
#include "utils.hpp"

using namespace std;

void validate(boost::any& v, const vector<string>& values, size_t*, int) {
    using namespace boost::program_options;
    validators::check_first_occurrence(v);

    string const& s = validators::get_single_string(values);
    if (s.empty() || s[0] == '-') {
        throw validation_error(validation_error::invalid_option_value);
    }

    v = boost::lexical_cast<size_t>(s);
}

void validate(boost::any& v, const vector<string>& values, struct time_limit*, int) {
    using namespace boost::program_options;
    validators::check_first_occurrence(v);

    struct time_limit result;
    string const& s = validators::get_single_string(values);
    auto colon = s.find(':');
    string left = s.substr(0, colon);
    string right = colon < s.size() ? s.substr(colon + 1) : "";

    result.soft = boost::lexical_cast<double>(left);
    if (right.size())
        result.hard = boost::lexical_cast<double>(right);
    else
        result.hard = result.soft;

    if (result.hard < result.soft ||
        !isfinite(result.hard) || !isfinite(result.soft) ||
        result.hard < 0 || result.soft < 0)
        throw validation_error(validation_error::invalid_option_value);

    v = result;
}

static int resolve_id(const string& name, int (*lookup)(const char*)) {
    if (is_number(name)) return boost::lexical_cast<int>(name);
    int id = lookup(name.c_str());
    if (id < 0) throw runtime_error("unknown user or group " + name);
    return id;
}

int main(int argc, const char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    namespace po = boost::program_options;
    po::options_description desc("runguard options");
    po::positional_options_description pos;
    po::variables_map vm;

    struct runguard_options opt;

    // clang-format off
    desc.add_options()
        ("root,r", po::value<string>(), "run command with root directory set to root. If this option is provided, running command is executed relative to the chroot.")
        ("work-dir,d", po::value<string>(), "change to the directory before running command (inside the chroot if root is set)")
        ("user,u", po::value<string>(), "run command as user with username or user id")
        ("group,g", po::value<string>(), "run command under group with groupname or group id. If only 'user' is set, this defaults to the same")
        ("wall-time,T", po::value<time_limit>(), "kill command after wall time clock seconds (floating point is acceptable)")
        ("cpu-time,t", po::value<time_limit>(), "set maximum CPU time (floating point is acceptable) consumption of the command in seconds")
        ("memory-limit,m", po::value<size_t>(), "set maximum memory consumption of the command in KB")
        ("memory-check-only", "do not install the memory limit, only report whether the peak memory usage exceeds it")
        ("file-limit,f", po::value<size_t>(), "set maximum created file size of the command in KB")
        ("nproc,p", po::value<size_t>(), "set maximum process living simutanously")
        ("cpuset,P", po::value<string>(), "set the processor IDs that can only be used (e.g. \"0,2-3\")")
        ("no-core-dumps", "disable core dumps")
        ("syscall-profile,S", po::value<string>(), "restrict syscalls of the command with a compiled-in seccomp profile")
        ("standard-input-file,i", po::value<string>(), "redirect command standard input fd to file")
        ("standard-output-file,o", po::value<string>(), "redirect command standard output fd to file")
        ("standard-error-file,e", po::value<string>(), "redirect command standard error fd to file")
        ("stream-size", po::value<size_t>(), "truncate command output streams at the size in bytes")
        ("environment,E", "preseve system environment variables (or only PATH is loaded)")
        ("variable,V", po::value<vector<string>>(), "add additional environment variables (e.g. -Vkey1=value1 -Vkey2=value2)")
        ("out-meta,M", po::value<string>(), "write runguard monitor results (run time, exitcode, memory usage, ...) to file")
        ("cmd", po::value<vector<string>>()->composing(), "commands")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    pos.add("cmd", -1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(pos)
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
        cout << "Runguard: Running user program in protected mode with system resource access limitations." << endl
             << "This app requires root privilege if either 'root' or 'user' option is provided." << endl
             << "Usage: " << argv[0] << " [options] -- [command]" << endl;
        cout << desc << endl;
        cout << "Syscall profiles (version " << SYSCALL_PROFILE_VERSION << "):" << endl;
        for (auto& profile : syscall_profiles())
            cout << "  " << profile.name << "\t" << profile.description << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "runguard, syscall profiles version " << SYSCALL_PROFILE_VERSION << endl;
        return EXIT_SUCCESS;
    }

    if (!vm.count("cmd")) {
        cerr << "no command specified" << endl;
        return EXIT_FAILURE;
    }

    try {
        if (vm.count("root")) opt.chroot_dir = vm["root"].as<string>();
        if (vm.count("work-dir")) opt.work_dir = vm["work-dir"].as<string>();

        if (vm.count("user")) opt.user_id = resolve_id(vm["user"].as<string>(), get_userid);

        if (vm.count("group"))
            opt.group_id = resolve_id(vm["group"].as<string>(), get_groupid);
        else if (vm.count("user"))
            opt.group_id = resolve_id(vm["user"].as<string>(), get_groupid);
    } catch (exception& e) {
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("variable")) opt.env = vm["variable"].as<vector<string>>();

    if (vm.count("wall-time")) opt.use_wall_limit = true, opt.wall_limit = vm["wall-time"].as<time_limit>();
    if (vm.count("cpu-time")) opt.use_cpu_limit = true, opt.cpu_limit = vm["cpu-time"].as<time_limit>();
    if (vm.count("memory-limit")) {
        size_t memory_limit = vm["memory-limit"].as<size_t>();
        if (memory_limit > (size_t)numeric_limits<int64_t>::max() / 1024)
            opt.memory_limit = -1;
        else
            opt.memory_limit = (int64_t)memory_limit * 1024;
    }
    if (vm.count("memory-check-only")) opt.memory_check_only = true;
    if (vm.count("file-limit")) opt.file_limit = (int64_t)vm["file-limit"].as<size_t>() * 1024;
    if (vm.count("nproc")) opt.nproc = vm["nproc"].as<size_t>();
    if (vm.count("no-core-dumps")) opt.no_core_dumps = true;
    if (vm.count("cpuset")) opt.cpuset = vm["cpuset"].as<string>();
    if (vm.count("syscall-profile")) opt.syscall_profile = vm["syscall-profile"].as<string>();
    if (vm.count("standard-input-file")) opt.stdin_filename = vm["standard-input-file"].as<string>();
    if (vm.count("standard-output-file")) opt.stdout_filename = vm["standard-output-file"].as<string>();
    if (vm.count("standard-error-file")) opt.stderr_filename = vm["standard-error-file"].as<string>();
    if (vm.count("stream-size")) opt.stream_size = (int64_t)vm["stream-size"].as<size_t>();
    if (vm.count("environment")) opt.preserve_sys_env = true;
    if (vm.count("out-meta")) opt.metafile_path = vm["out-meta"].as<string>();
    opt.command = vm["cmd"].as<vector<string>>();

    if (!is_known_syscall_profile(opt.syscall_profile)) {
        cerr << "unknown syscall profile " << opt.syscall_profile << endl;
        return EXIT_FAILURE;
    }

    return runit(opt);
}
