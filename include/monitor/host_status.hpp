#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace judged {

/**
 * @brief /proc/stat 第一行的 CPU 时间统计
 */
struct cpu_times {
    uint64_t idle = 0;
    uint64_t total = 0;
};

/**
 * @brief 解析 /proc/stat 的内容
 * @throw std::runtime_error 当格式错误时
 */
cpu_times parse_proc_stat(const std::string &content);

/**
 * @brief 计算两次采样之间的 CPU 使用率（百分比）
 */
double cpu_usage(const cpu_times &before, const cpu_times &after);

/**
 * @brief 解析 /proc/meminfo 的内容
 * @return 内存使用率（百分比），由 MemTotal 和 MemAvailable 计算
 * @throw std::runtime_error 当格式错误时
 */
double parse_meminfo(const std::string &content);

/**
 * @brief 评测服务端所在主机的状态，由 ping 返回
 */
struct host_status {
    std::string hostname;

    /**
     * @brief CPU 使用率（百分比）
     */
    double cpu;

    int cpu_core;

    /**
     * @brief 内存使用率（百分比）
     */
    double memory;

    std::string version;

    nlohmann::json to_json() const;
};

/**
 * @brief 采样主机状态
 * CPU 使用率在固定的 100ms 窗口内采样，因此调用总是在 1 秒内返回
 */
host_status sample_host_status();

}  // namespace judged
