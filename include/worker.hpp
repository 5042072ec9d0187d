#pragma once

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "common/messages.hpp"

/**
 * 评测 worker 池
 * 每个 worker 线程独占一个 CPU 核心，从 task_queue 中取出任务执行。
 * 编译、运行选手程序、运行 special judge 都必须作为任务提交到 worker 池中，
 * 因此 worker 的数量就是同时运行的沙箱进程数的上限，多余的任务在队列中等待。
 *
 * 沙箱的时钟时间限制在 worker 取出任务之后才开始计时，任务在队列中等待的时间
 * 不计入选手程序的运行时间。
 */
namespace judged {

struct worker_pool {
    /**
     * @brief 为每个核心启动一个 worker
     * @param cores worker 绑定的 CPU 核心
     */
    explicit worker_pool(const std::vector<size_t> &cores);

    worker_pool(const worker_pool &) = delete;
    worker_pool &operator=(const worker_pool &) = delete;

    /**
     * @brief 停止所有 worker 并等待它们退出
     */
    ~worker_pool();

    /**
     * @brief 提交一个任务
     * @param f 任务函数，参数为 const task_context &
     * @return 任务结果，任务抛出的异常会在 future::get() 时重新抛出
     * @throw internal_error 当 worker 池已经停止时
     */
    template <typename F>
    auto submit(F &&f) -> std::future<std::invoke_result_t<std::decay_t<F> &, const task_context &>> {
        using result_type = std::invoke_result_t<std::decay_t<F> &, const task_context &>;
        auto task = std::make_shared<std::packaged_task<result_type(const task_context &)>>(std::forward<F>(f));
        auto result = task->get_future();
        push([task](const task_context &ctx) { (*task)(ctx); });
        return result;
    }

    /**
     * @brief 停止所有 worker
     * 已经在队列中的任务仍然会被执行完，之后提交的任务会被拒绝
     */
    void stop();

    size_t size() const;

    /**
     * @brief 正在队列中等待的任务数
     */
    size_t pending() const;

private:
    void push(std::function<void(const task_context &)> run);

    concurrent_queue<message::run_task> task_queue;
    std::vector<std::thread> workers;
    // 保护 stopped 与入队，保证空任务之后不会再有任务入队
    std::mutex mut;
    std::atomic<bool> stopped;
};

}  // namespace judged
