#pragma once

#include <sys/types.h>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace judged {

/**
 * @brief runguard 写出的 meta 文件的内容
 * @see runguard/include/run.hpp
 */
struct runguard_result {
    /**
     * @brief 时钟时间
     * 单位为秒
     */
    double wall_time = -1;

    /**
     * @brief 用户时间（指在用户态下运行的 CPU 时间）
     * 单位为秒，如果是多线程程序，所有线程的 CPU 时间会累加
     */
    double user_time = -1;

    /**
     * @brief 系统时间（指在内核态下运行的时间）
     * 单位为秒，如果是多线程程序，所有线程的 CPU 时间会累加
     */
    double sys_time = -1;

    /**
     * @brief CPU 时间，由 cgroup 的 cpuacct 统计
     * 单位为秒，如果是多线程程序，所有线程的 CPU 时间会累加
     */
    double cpu_time = -1;

    int exitcode = -1;

    /**
     * @brief 终止程序的信号，没有被信号终止时为 0
     */
    int signal = 0;

    std::string internal_error;

    /**
     * @brief 内存使用峰值（单位为字节）
     */
    int64_t memory = -1;

    /**
     * @brief 空串、soft-timelimit 或 hard-timelimit
     */
    std::string cpu_time_result;
    std::string wall_time_result;

    /**
     * @brief 空串、oom 或 exceeded
     */
    std::string memory_result;

    /**
     * @brief 被截断的输出流，比如 "stdout,stderr"
     */
    std::string output_truncated;

    /**
     * @brief 程序被 seccomp 杀死时为 restricted
     */
    std::string syscall_result;

    /**
     * @brief meta 文件是否包含运行结果
     * runguard 在启动子进程之前出错时只会写出 internal-error
     */
    bool complete = false;
};

/**
 * @brief 解析 meta 文件的文本内容
 */
runguard_result parse_runguard_result(const std::string &metadata);

/**
 * @brief 读取 meta 文件
 * @throw std::system_error 当 meta 文件不存在时
 */
runguard_result read_runguard_result(const std::filesystem::path &metafile);

/**
 * @brief 一次 runguard 调用的参数
 */
struct runguard_invocation {
    std::vector<std::string> command;
    std::filesystem::path work_dir;

    int64_t cpu_time_ms = -1;
    int64_t real_time_ms = -1;
    int64_t memory_bytes = -1;
    bool memory_check_only = false;
    int64_t file_limit_bytes = -1;
    int64_t stream_size_bytes = -1;
    size_t nproc = 0;

    /**
     * @brief 程序只能运行在这个 CPU 核心上
     */
    std::optional<size_t> cpuset;

    std::string user;
    std::string group;
    std::string syscall_profile;
    std::vector<std::string> env;

    std::filesystem::path stdin_file;
    std::filesystem::path stdout_file;
    /**
     * @brief 与 stdout_file 相同时合并 stdout 和 stderr
     */
    std::filesystem::path stderr_file;
    std::filesystem::path meta_file;
};

/**
 * @brief 生成调用 runguard 的命令行参数（不含 runguard 本身）
 */
std::vector<std::string> runguard_arguments(const runguard_invocation &invocation);

/**
 * @brief 调用 runguard 并等待其退出
 * @param on_spawn runguard 进程创建后调用，用于登记进程以便取消
 * @return runguard 的返回值
 */
int run_runguard(const runguard_invocation &invocation, const std::function<void(pid_t)> &on_spawn);

}  // namespace judged
