#pragma once

#include <string>
#include <vector>

/**
 * @brief 编译进 runguard 的系统调用规则表
 *
 * 每个规则对应 limits.cpp 中的一个 seccomp 过滤器。评测服务端在接收请求时
 * 通过本表校验 seccomp_rule 的名称，因此本表与 runguard 一起作为一个
 * 静态库链接进评测服务端。修改任何规则的语义都必须增加 SYSCALL_PROFILE_VERSION。
 *
 * 1. c_cpp - 白名单，只允许读文件和标准输入输出，适用于 C/C++ 编译出的程序
 * 2. c_cpp_file_io - 在 c_cpp 的基础上允许以写模式打开文件
 * 3. general - 黑名单，禁止网络、创建进程、发送信号、执行其他程序，适用于解释器
 * 4. golang - 与 general 相同，但允许创建线程
 * 5. node - 与 golang 相同，供 node.js 使用
 */
constexpr int SYSCALL_PROFILE_VERSION = 1;

struct syscall_profile_info {
    const char *name;
    const char *description;
};

/**
 * @brief 所有规则的列表，按名称排序
 */
const std::vector<syscall_profile_info> &syscall_profiles();

/**
 * @brief 检查规则名称是否合法
 * @param name 规则名称，空字符串表示不限制系统调用，也是合法的
 */
bool is_known_syscall_profile(const std::string &name);
