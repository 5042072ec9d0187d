#pragma once

#include <sys/types.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <set>

namespace judged {

/**
 * @brief 一次 judge 或 compile_spj 调用的取消令牌
 * 记录该调用正在运行的 runguard 进程，取消时向它们发送 SIGTERM，
 * runguard 收到信号后会杀死整个进程组并删除 cgroup。
 * 还在队列中的任务开始执行前会检查令牌，被取消后直接跳过。
 */
struct cancellation {
    /**
     * @brief 登记一个正在运行的 runguard 进程
     * 如果调用已经被取消，立刻结束这个进程
     */
    void register_process(pid_t pid);

    void unregister_process(pid_t pid);

    /**
     * @brief 取消调用并结束所有已登记的进程
     */
    void cancel();

    bool cancelled() const;

    /**
     * @throw judge_cancelled 若调用已经被取消
     */
    void throw_if_cancelled() const;

private:
    mutable std::mutex mut;
    std::set<pid_t> processes;
    std::atomic<bool> is_cancelled{false};
};

/**
 * @brief 记录所有正在进行的调用，评测服务端退出时全部取消
 */
struct cancellation_registry {
    /**
     * @brief 创建一个新的取消令牌，调用结束后需要通过 remove 注销
     * 若评测服务端已经在退出，新的令牌会处于已取消状态
     */
    std::shared_ptr<cancellation> create();

    void remove(const std::shared_ptr<cancellation> &token);

    /**
     * @brief 取消所有正在进行的调用，此后创建的令牌也是已取消的
     */
    void cancel_all();

private:
    std::mutex mut;
    std::set<std::shared_ptr<cancellation>> tokens;
    bool shutting_down = false;
};

}  // namespace judged
