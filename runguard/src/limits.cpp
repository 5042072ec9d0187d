#include "limits.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <grp.h>
#include <libcgroup.h>
#include <math.h>
#include <sched.h>
#include <seccomp.h>
#include <signal.h>
#include <sys/resource.h>
#include <unistd.h>
#include <memory>
#include <system_error>
#include "cgroup.hpp"
#include "syscall_profile.hpp"
#include "utils.hpp"

using namespace std;

void cgroup_create(const struct runguard_options &opt) {
    cgroup_guard cg(opt.cgroupname);

    // 初始化 memory 资源管控器，即使只检查内存也需要通过它统计内存峰值
    cgroup_ctrl ctrl = cg.add_controller("memory");

    if (opt.memory_limit >= 0 && !opt.memory_check_only) {
        // 将 RAM 和 RAM+交换 的大小限制设为一样可以强制不发生交换
        ctrl.add_value("memory.limit_in_bytes", opt.memory_limit);
        ctrl.add_value("memory.memsw.limit_in_bytes", opt.memory_limit);
    }

    if (!opt.cpuset.empty()) {
        // 设置选手程序能使用的 CPU（我们必须让这些程序独占 CPU 以避免时间计量不准确
        cgroup_ctrl cpuset_ctrl = cg.add_controller("cpuset");

        // TODO: cpuset.mems 需要被设置为对应的 NUMA 以避免跨 NUMA 导致内存访问慢
        cpuset_ctrl.add_value("cpuset.mems", "0");
        cpuset_ctrl.add_value("cpuset.cpus", opt.cpuset);
    } else {
        LOG(INFO) << "cpuset undefined";
    }

    // 我们要统计选手程序的运行时间
    cg.add_controller("cpuacct");

    cg.create_cgroup(1);
}

void cgroup_attach(const struct runguard_options &opt) {
    cgroup_guard cg(opt.cgroupname);
    cg.get_cgroup();
    cg.attach_task();
}

void cgroup_kill(const struct runguard_options &opt) {
    void *ptr = nullptr;
    pid_t pid;

    while (true) {
        int ret = cgroup_get_task_begin(opt.cgroupname.c_str(), "memory", &ptr, &pid);
        cgroup_get_task_end(&ptr);
        if (ret == ECGEOF)
            break;
        if (ret != 0)
            throw cgroup_exception("cgroup_get_task_begin", ret);
        if (kill(pid, SIGKILL) != 0 && errno != ESRCH)
            throw system_error(errno, generic_category(), fmt::format("killing process {} of cgroup", pid));
    }
}

void cgroup_delete(const struct runguard_options &opt) {
    cgroup_guard cg(opt.cgroupname);
    cg.add_controller("cpuacct");
    cg.add_controller("memory");

    if (!opt.cpuset.empty()) {
        cg.add_controller("cpuset");
    }

    cg.delete_cgroup();
}

static void set_rlimit(int resource, rlim_t cur, rlim_t max) {
    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    if (setrlimit(resource, &lim) != 0)
        throw system_error(errno, generic_category(), "setrlimit");
}

void set_restrictions(const struct runguard_options &opt) {
    if (!opt.preserve_sys_env) {
        char *path = getenv("PATH");
        string saved_path = path ? path : "";
        if (clearenv() != 0)
            throw runtime_error("unable to clear environment");
        if (!saved_path.empty()) setenv("PATH", saved_path.c_str(), true);
    }

    for (auto &entry : opt.env) {
        auto idx = entry.find('=');
        if (idx == string::npos)
            throw runtime_error(fmt::format("malformed environment variable '{}'", entry));
        setenv(entry.substr(0, idx).c_str(), entry.substr(idx + 1).c_str(), true);
    }

    if (opt.use_cpu_limit) {
        /* Setting the real hard limit one second
		   higher: at the soft limit the kernel will send SIGXCPU at
		   the hard limit a SIGKILL. The SIGXCPU can be caught, but is
		   not by default and gives us a reliable way to detect if the
		   CPU-time limit was reached. */
        rlim_t cputime_limit = (rlim_t)ceil(opt.cpu_limit.hard);
        set_rlimit(RLIMIT_CPU, cputime_limit, cputime_limit + 1);
    }

    // memory limits(RLIMIT_AS, RLIMIT_DATA) are handled by cgroups
    set_rlimit(RLIMIT_AS, RLIM_INFINITY, RLIM_INFINITY);
    set_rlimit(RLIMIT_DATA, RLIM_INFINITY, RLIM_INFINITY);

    set_rlimit(RLIMIT_STACK, RLIM_INFINITY, RLIM_INFINITY);

    if (opt.file_limit > 0) set_rlimit(RLIMIT_FSIZE, opt.file_limit, opt.file_limit + 1);
    if (opt.nproc != numeric_limits<size_t>::max()) set_rlimit(RLIMIT_NPROC, opt.nproc, opt.nproc);
    if (opt.no_core_dumps) set_rlimit(RLIMIT_CORE, 0, 0);

    // put child process in the control group
    cgroup_attach(opt);

    // run the command in a separate process group,
    // so the command and all its child processes can be killed
    // off with one signal
    if (setsid() == -1)
        throw system_error(errno, generic_category(), "unable to setsid");

    // set root directory and change working directory
    if (!opt.chroot_dir.empty()) {
        if (chroot(opt.chroot_dir.c_str()) != 0)
            throw system_error(errno, generic_category(), fmt::format("unable to chroot to {}", opt.chroot_dir));
        if (chdir("/") != 0)
            throw system_error(errno, generic_category(), "unable to chdir to / in chroot");

        LOG(INFO) << "chrooted to directory " << opt.chroot_dir;
    }

    if (!opt.work_dir.empty()) {
        if (chdir(opt.work_dir.c_str()) != 0)
            throw system_error(errno, generic_category(), fmt::format("unable to chdir to {}", opt.work_dir));
    }

    if (opt.group_id >= 0) {
        if (setgid(opt.group_id))
            throw system_error(errno, generic_category(), "unable to set group id");
        gid_t aux_groups[1];
        aux_groups[0] = opt.group_id;
        if (setgroups(1, aux_groups))
            throw system_error(errno, generic_category(), "unable to clear auxiliary groups");
    }

    if (opt.user_id >= 0) {
        if (setuid(opt.user_id))
            throw system_error(errno, generic_category(), "unable to set user id");
    } else {
        if (setuid(getuid()))
            throw system_error(errno, generic_category(), "unable to reset user id");
    }

    if (geteuid() == 0 || getuid() == 0)
        throw runtime_error("you cannot run user command as root");
}

namespace {

struct seccomp_filter {
    scmp_filter_ctx ctx;

    explicit seccomp_filter(uint32_t def_action) : ctx(seccomp_init(def_action)) {
        if (!ctx) throw runtime_error("seccomp_init failed");
    }

    ~seccomp_filter() {
        seccomp_release(ctx);
    }

    void add(uint32_t action, int syscall) {
        ensure(seccomp_rule_add(ctx, action, syscall, 0), syscall);
    }

    void add(uint32_t action, int syscall, scmp_arg_cmp cmp) {
        ensure(seccomp_rule_add(ctx, action, syscall, 1, cmp), syscall);
    }

    void load() {
        int ret = seccomp_load(ctx);
        if (ret < 0)
            throw system_error(-ret, generic_category(), "seccomp_load");
    }

private:
    static void ensure(int ret, int syscall) {
        if (ret < 0)
            throw system_error(-ret, generic_category(), fmt::format("seccomp_rule_add({})", syscall));
    }
};

const int c_cpp_whitelist[] = {
    SCMP_SYS(read), SCMP_SYS(pread64), SCMP_SYS(readv), SCMP_SYS(write), SCMP_SYS(writev),
    SCMP_SYS(fstat), SCMP_SYS(newfstatat), SCMP_SYS(lseek), SCMP_SYS(close),
    SCMP_SYS(mmap), SCMP_SYS(mprotect), SCMP_SYS(munmap), SCMP_SYS(mremap), SCMP_SYS(brk),
    SCMP_SYS(uname), SCMP_SYS(arch_prctl), SCMP_SYS(access), SCMP_SYS(faccessat),
    SCMP_SYS(readlink), SCMP_SYS(readlinkat), SCMP_SYS(sysinfo), SCMP_SYS(getrandom),
    SCMP_SYS(clock_gettime), SCMP_SYS(gettimeofday), SCMP_SYS(time),
    SCMP_SYS(set_tid_address), SCMP_SYS(set_robust_list), SCMP_SYS(rseq), SCMP_SYS(prlimit64),
    SCMP_SYS(futex), SCMP_SYS(rt_sigaction), SCMP_SYS(rt_sigprocmask), SCMP_SYS(rt_sigreturn),
    SCMP_SYS(exit), SCMP_SYS(exit_group)};

void c_cpp_rules(seccomp_filter &filter, const char *exe_path, bool allow_write) {
    for (int syscall : c_cpp_whitelist)
        filter.add(SCMP_ACT_ALLOW, syscall);

    filter.add(SCMP_ACT_ALLOW, SCMP_SYS(execve), SCMP_A0(SCMP_CMP_EQ, (scmp_datum_t)exe_path));

    if (allow_write) {
        filter.add(SCMP_ACT_ALLOW, SCMP_SYS(open));
        filter.add(SCMP_ACT_ALLOW, SCMP_SYS(openat));
        filter.add(SCMP_ACT_ALLOW, SCMP_SYS(dup));
        filter.add(SCMP_ACT_ALLOW, SCMP_SYS(dup2));
        filter.add(SCMP_ACT_ALLOW, SCMP_SYS(dup3));
    } else {
        // do not allow "w" and "rw"
        filter.add(SCMP_ACT_ALLOW, SCMP_SYS(open), SCMP_CMP(1, SCMP_CMP_MASKED_EQ, O_WRONLY | O_RDWR, 0));
        filter.add(SCMP_ACT_ALLOW, SCMP_SYS(openat), SCMP_CMP(2, SCMP_CMP_MASKED_EQ, O_WRONLY | O_RDWR, 0));
    }
}

void general_rules(seccomp_filter &filter, const char *exe_path, bool allow_threads) {
    for (int syscall : {SCMP_SYS(socket), SCMP_SYS(fork), SCMP_SYS(vfork), SCMP_SYS(kill), SCMP_SYS(execveat)})
        filter.add(SCMP_ACT_KILL, syscall);

    if (allow_threads)
        filter.add(SCMP_ACT_KILL, SCMP_SYS(clone), SCMP_A0(SCMP_CMP_MASKED_EQ, CLONE_THREAD, 0));
    else
        filter.add(SCMP_ACT_KILL, SCMP_SYS(clone));

    filter.add(SCMP_ACT_KILL, SCMP_SYS(execve), SCMP_A0(SCMP_CMP_NE, (scmp_datum_t)exe_path));

    // do not allow "w" and "rw"
    filter.add(SCMP_ACT_KILL, SCMP_SYS(open), SCMP_CMP(1, SCMP_CMP_MASKED_EQ, O_WRONLY, O_WRONLY));
    filter.add(SCMP_ACT_KILL, SCMP_SYS(open), SCMP_CMP(1, SCMP_CMP_MASKED_EQ, O_RDWR, O_RDWR));
    filter.add(SCMP_ACT_KILL, SCMP_SYS(openat), SCMP_CMP(2, SCMP_CMP_MASKED_EQ, O_WRONLY, O_WRONLY));
    filter.add(SCMP_ACT_KILL, SCMP_SYS(openat), SCMP_CMP(2, SCMP_CMP_MASKED_EQ, O_RDWR, O_RDWR));
}

}  // namespace

void set_seccomp(const struct runguard_options &opt, const char *exe_path) {
    const string &profile = opt.syscall_profile;
    if (profile.empty()) return;

    if (profile == "c_cpp" || profile == "c_cpp_file_io") {
        seccomp_filter filter(SCMP_ACT_KILL);
        c_cpp_rules(filter, exe_path, profile == "c_cpp_file_io");
        filter.load();
    } else if (profile == "general" || profile == "golang" || profile == "node") {
        seccomp_filter filter(SCMP_ACT_ALLOW);
        general_rules(filter, exe_path, profile != "general");
        filter.load();
    } else {
        throw runtime_error(fmt::format("unknown syscall profile '{}'", profile));
    }
}
