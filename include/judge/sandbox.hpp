#pragma once

#include <cstdint>
#include <optional>
#include "common/messages.hpp"
#include "common/status.hpp"
#include "judge/cancellation.hpp"
#include "runguard.hpp"

namespace judged {

/**
 * @brief 沙箱中一次运行的原始结果，由判定器转换为评测结果
 * 超出限制的标志之间互斥的优先级由判定器决定，这里只如实记录 runguard 的报告
 */
struct raw_outcome {
    /**
     * @brief CPU 时间（毫秒）
     */
    int64_t cpu_time = 0;

    /**
     * @brief 时钟时间（毫秒）
     */
    int64_t real_time = 0;

    /**
     * @brief 内存峰值（字节）
     */
    int64_t memory = 0;

    /**
     * @brief 终止程序的信号，0 表示正常退出
     */
    int signal = 0;

    int exit_code = 0;

    bool cpu_time_exceeded = false;
    bool real_time_exceeded = false;
    bool memory_exceeded = false;

    /**
     * @brief stdout 或 stderr 超出了 stream-size 被截断
     */
    bool output_truncated = false;

    /**
     * @brief 程序调用了被禁止的系统调用
     */
    bool syscall_restricted = false;

    /**
     * @brief 沙箱本身出错，此时其他字段没有意义
     */
    std::optional<error_kind> engine_fault;
};

/**
 * @brief 将 runguard 的 meta 转换为原始结果
 */
raw_outcome to_raw_outcome(const runguard_result &result);

/**
 * @brief 根据 runguard 的 internal-error 判断沙箱出错的原因
 */
error_kind classify_internal_error(const std::string &message);

/**
 * @brief 生成在 worker 上运行程序的 runguard 参数
 * 填好运行用户、CPU 核心、进程数和文件大小限制，其余参数由调用方填写
 */
runguard_invocation make_invocation(const task_context &ctx);

/**
 * @brief 在沙箱中运行程序并等待其退出
 * runguard 无法启动或没有写出运行信息时返回 engine_fault，不抛出异常
 * @throw judge_cancelled 当调用被取消时
 */
raw_outcome run_in_sandbox(const runguard_invocation &invocation, cancellation &token);

}  // namespace judged
