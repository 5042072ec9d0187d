#pragma once

#include <fmt/core.h>
#include <glog/logging.h>
#include <sys/types.h>
#include <boost/lexical_cast.hpp>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace fmt {
template <>
struct formatter<std::filesystem::path> : formatter<std::string> {
    template <typename FormatContext>
    auto format(const std::filesystem::path &p, FormatContext &ctx) const {
        return formatter<std::string>::format(p.string(), ctx);
    }
};
}  // namespace fmt

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

template <>
struct to_string_cont<std::string> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::string &element) {
        cont.push_back(element);
    }
};

template <>
struct to_string_cont<std::filesystem::path> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::filesystem::path &element) {
        cont.push_back(element.string());
    }
};

template <typename T>
struct to_string_cont<std::vector<T>> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::vector<T> &vec) {
        for (const T &value : vec)
            to_string_cont<T>::to_string(cont, value);
    }
};

/**
 * @brief 将参数 args 的内容通过 to_string 转换为字符串并装入容器中
 * @param cont 字符串容器
 * @param args 按顺序 to_string 转换为字符串并装入容器（如果 arg 本身为容器，则遍历这个容器将各个元素加入结果容器中）
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, const Head &head, const Args &... args) {
    to_string_cont<std::decay_t<Head>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

/**
 * @brief 执行外部命令并等待其退出
 * @param env additional environment variables
 * @param argv 外部命令的路径 (argv[0]) 和 参数 (argv)
 * @param on_spawn 子进程创建后、等待之前调用，用于登记子进程以便取消
 * @return 外部命令的返回值，如果外部命令因为信号崩溃而没有返回码，则返回 -1
 * @throw std::system_error 当 fork 或 waitpid 失败时
 */
int exec_program(const std::map<std::string, std::string> &env, const char **argv,
                 const std::function<void(pid_t)> &on_spawn = {});

/**
 * @brief 调用外部程序
 * @note 与 exec_program(argv) 的区别是，这个函数是类型安全的，而且会自动执行类型转换
 * @note 与 system(cmd) 的区别是，这个函数避免了转义导致的安全问题
 * @param args 转送给应用程序的参数列表，比如可以传入 filesystem::path 给 args[0] 来表示应用程序路径
 * @code{.cpp}
 *     std::filesystem::path shell("/bin/bash");
 *     std::filesystem::path script("/tmp/shell.sh");
 *     // 相当于 system("bin/bash /tmp/shell.sh");
 *     int exitcode = call_process(shell, script);
 * @endcode
 */
template <typename... Args>
int call_process_env(const std::map<std::string, std::string> &env,
                     const std::function<void(pid_t)> &on_spawn,
                     const Args &... args) {
    std::vector<std::string> list;
    to_string_list(list, args...);
    std::vector<const char *> argv;
    for (auto &arg : list) argv.push_back(arg.c_str());
    argv.push_back(nullptr);

#ifndef NDEBUG
    std::stringstream ss;
    for (auto &arg : list) ss << arg << ' ';
    LOG(INFO) << ss.str();
#endif

    return exec_program(env, argv.data(), on_spawn);
}

template <typename... Args>
int call_process(const Args &... args) {
    return call_process_env({}, {}, args...);
}

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 设置环境变量
 * @param key 环境变量的键
 * @param value 环境变量的值
 * @param replace 若为真，则覆盖已有的环境变量值
 */
void set_env(const std::string &key, const std::string &value, bool replace = true);

struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};
