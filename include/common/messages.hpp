#pragma once

#include <chrono>
#include <cstddef>
#include <functional>

namespace judged {

/**
 * @brief worker 执行任务时的上下文
 */
struct task_context {
    /**
     * @brief worker 独占的 CPU 核心，沙箱内的程序也只能在这个核心上运行
     */
    size_t core_id;

    /**
     * @brief 任务进入队列的时间
     */
    std::chrono::steady_clock::time_point queued_at;

    /**
     * @brief 任务被 worker 取出开始执行的时间
     * 时钟时间限制从这之后 runguard 创建子进程时开始计算，排队时间不计入
     */
    std::chrono::steady_clock::time_point dispatched_at;
};

namespace message {

/**
 * @brief worker 池中的一个任务
 * run 为空表示要求 worker 退出
 */
struct run_task {
    std::function<void(const task_context &)> run;
    std::chrono::steady_clock::time_point queued_at;
};

}  // namespace message
}  // namespace judged
