#pragma once

#include <cstdint>
#include <exception>
#include <string>

struct cgroup;
struct cgroup_controller;

struct cgroup_exception : public std::exception {
    cgroup_exception(const std::string &cgroup_op, int err);

    const char *what() const noexcept override;

    static void ensure(const std::string &cgroup_op, int err);
private:
    std::string errmsg;
};

/**
 * @brief 表示一个 cgroup 的 controller
 *
 * runguard 使用的 controller 有：
 * 1. cpuacct - 统计 cgroup 中任务占用的 CPU 时间
 * 2. cpuset - 给 cgroup 中的任务分配独立 CPU（在多芯系统中）和内存节点
 * 3. memory - 对 cgroup 中的任务可用内存做出限制，并且统计内存峰值和 OOM 次数
 *
 * https://access.redhat.com/documentation/zh-cn/red_hat_enterprise_linux/7/html/resource_management_guide/ch-subsystems_and_tunable_parameters
 */
struct cgroup_ctrl {
    struct cgroup_controller *ctrl;

    void add_value(const std::string &name, int64_t value);

    void add_value(const std::string &name, const std::string &value);

    int64_t get_value_int64(const std::string &name);

    /**
     * @brief 读取多行的参数，比如 memory.oom_control
     */
    std::string get_value_string(const std::string &name);
};

/**
 * @brief 创建指定 cgroup 的管理器
 * 在析构时释放 libcgroup 分配的内存，不会修改内核中的 cgroup
 */
struct cgroup_guard {
    /**
     * @param cgroup_name cgroup 的内核名称
     */
    explicit cgroup_guard(const std::string &cgroup_name);

    cgroup_guard(const cgroup_guard &) = delete;
    cgroup_guard &operator=(const cgroup_guard &) = delete;

    ~cgroup_guard();

    /**
     * @brief 在内核中创建这个 cgroup
     * 将 add_controller 函数、add_value 函数添加的数据也写入内核中。
     */
    void create_cgroup(int ignore_ownership);

    /**
     * @throw cgroup_exception 当创建失败时
     */
    cgroup_ctrl add_controller(const std::string &name);

    /**
     * @brief 从 cgroup 中获得 add_controller 添加过或 get_cgroup 读入的 controller
     * @throw cgroup_exception 当 controller 不存在时
     */
    cgroup_ctrl get_controller(const std::string &name);

    /**
     * 从内核中读入 cgroup 绑定的所有 controller 和参数
     */
    void get_cgroup();

    /**
     * 将当前进程移入本 cgroup
     */
    void attach_task();

    /**
     * @brief 从内核中删除这个 cgroup，剩余的进程会被移入上一层的 cgroup
     */
    void delete_cgroup();

    static void init();

private:
    struct cgroup *cg;
};
