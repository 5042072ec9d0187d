#include "worker.hpp"
#include <glog/logging.h>
#include <pthread.h>
#include <sched.h>
#include <cstring>
#include "common/exceptions.hpp"

namespace judged {
using namespace std;

/**
 * @brief 评测 worker 线程函数
 * 从队列中读取任务并执行，遇到空任务时退出。
 * @param core_id 当前 worker 占有的 CPU id
 * @param task_queue 任务队列
 */
static void worker_loop(size_t core_id, concurrent_queue<message::run_task> &task_queue) {
    // 设置当前线程的 CPU 亲和性，要求操作系统将 worker 放在指定的 CPU 上运行
    cpu_set_t set;
    CPU_ZERO(&set);
    CPU_SET(core_id, &set);
    int ret = pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &set);
    if (ret != 0)
        LOG(WARNING) << "Unable to bind worker to core " << core_id << ": " << strerror(ret);

    LOG(INFO) << "Worker " << core_id << " started";

    while (true) {
        message::run_task task = task_queue.pop();
        if (!task.run) break;

        task_context ctx;
        ctx.core_id = core_id;
        ctx.queued_at = task.queued_at;
        ctx.dispatched_at = chrono::steady_clock::now();
        // packaged_task 会把异常保存到 future 中，因此这里不会抛出异常
        task.run(ctx);
    }

    LOG(INFO) << "Worker " << core_id << " stopped";
}

worker_pool::worker_pool(const vector<size_t> &cores) : stopped(false) {
    if (cores.empty())
        throw invalid_argument("worker pool requires at least one core");
    for (size_t core_id : cores) {
        workers.emplace_back([core_id, this] {
            worker_loop(core_id, task_queue);
        });
    }
}

worker_pool::~worker_pool() {
    stop();
    for (auto &th : workers)
        if (th.joinable()) th.join();
}

void worker_pool::stop() {
    lock_guard<mutex> guard(mut);
    if (stopped.exchange(true)) return;
    // 每个 worker 取到一个空任务后退出，空任务排在已提交的任务之后
    for (size_t i = 0; i < workers.size(); ++i)
        task_queue.push(message::run_task{});
}

size_t worker_pool::size() const {
    return workers.size();
}

size_t worker_pool::pending() const {
    return task_queue.size();
}

void worker_pool::push(function<void(const task_context &)> run) {
    lock_guard<mutex> guard(mut);
    if (stopped)
        throw internal_error("worker pool stopped");
    task_queue.push(message::run_task{move(run), chrono::steady_clock::now()});
}

}  // namespace judged
