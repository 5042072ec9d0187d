#pragma once

namespace judged {

/**
 * @brief 表示一个测试数据点的评测结果，即 ExecutionResult 的 result 字段
 */
enum class result_code {
    /**
     * @brief 答案错误
     * 程序正常退出，但输出与标准输出不一致，或者 special judge 判定答案错误
     */
    WRONG_ANSWER = -1,

    /**
     * @brief 程序正常退出且答案正确
     */
    SUCCESS = 0,

    /**
     * @brief 用户程序 CPU 时间超出限制
     */
    CPU_TIME_LIMIT_EXCEEDED = 1,

    /**
     * @brief 用户程序时钟时间超出限制
     * 一般是程序在等待输入或者 sleep
     */
    REAL_TIME_LIMIT_EXCEEDED = 2,

    /**
     * @brief 用户程序运行内存超限
     * 由于 cgroup 限制内存使用会导致进程被 OOM killer 杀死，
     * 因此我们通过 memory.oom_control 来判断内存超限，而不是根据终止信号判断。
     */
    MEMORY_LIMIT_EXCEEDED = 3,

    /**
     * @brief 用户程序出现运行时错误
     * 被信号终止、返回值不为 0、输出超限、调用了被禁止的系统调用
     */
    RUNTIME_ERROR = 4,

    /**
     * @brief 评测系统内部错误
     * 沙箱无法启动、special judge 出错等，与用户程序无关
     */
    SYSTEM_ERROR = 5
};

/**
 * @brief 表示评测结果的附加错误信息，即 ExecutionResult 的 error 字段
 * 负数表示沙箱或评测系统的错误
 */
enum class error_kind {
    SUCCESS = 0,
    INVALID_CONFIG = -1,
    FORK_FAILED = -2,
    WAIT_FAILED = -4,
    ROOT_REQUIRED = -5,
    LOAD_SECCOMP_FAILED = -6,
    SETRLIMIT_FAILED = -7,
    DUP2_FAILED = -8,
    SETUID_FAILED = -9,
    EXECVE_FAILED = -10,

    /**
     * @brief special judge 没有以 0 或 1 退出
     */
    SPJ_ERROR = -11,

    /**
     * @brief 用户程序调用了系统调用规则禁止的系统调用
     */
    SYSCALL_RESTRICTED = -12,

    /**
     * @brief 用户程序的输出超过了 OUTPUT_LIMIT
     */
    OUTPUT_LIMIT_EXCEEDED = -13,

    /**
     * @brief 编译完成后找不到可执行文件
     */
    ARTIFACT_MISSING = -14,

    /**
     * @brief runguard 无法运行、崩溃或者没有写出运行信息
     */
    SANDBOX_FAILED = -15
};

const char *get_display_message(result_code code);

const char *get_display_message(error_kind kind);

}  // namespace judged
