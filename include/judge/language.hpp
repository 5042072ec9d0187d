#pragma once

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

/**
 * 这个头文件包含语言配置
 * 包含：
 * 1. command_template 类（表示一个带占位符的命令模板）
 * 2. compile_config 类（表示编译选项，也用于编译 special judge）
 * 3. run_config 类（表示运行选项）
 * 4. spj_config 类（表示 special judge 的运行选项）
 */
namespace judged {

/**
 * @brief 编译命令可以使用的占位符
 */
extern const std::set<std::string> COMPILE_SLOTS;

/**
 * @brief 运行命令可以使用的占位符
 */
extern const std::set<std::string> RUN_SLOTS;

/**
 * @brief special judge 运行命令可以使用的占位符
 */
extern const std::set<std::string> SPJ_SLOTS;

/**
 * @brief 带占位符的命令模板，比如 "/usr/bin/g++ {src_path} -o {exe_path}"
 * 命令在加载时按 shell 规则拆分成参数，每个参数中的 {name} 在执行前被替换。
 * 由于替换发生在拆分之后，替换进来的路径即便包含空格也不会被拆开。
 */
struct command_template {
    /**
     * @brief 拆分并检查命令模板
     * @param command 命令模板
     * @param slots 允许使用的占位符
     * @throw invalid_request 当命令为空、括号不配对或者使用了 slots 以外的占位符
     */
    static command_template parse(const std::string &command, const std::set<std::string> &slots);

    /**
     * @brief 替换所有占位符
     * @param values 占位符的值，必须包含模板用到的所有占位符
     */
    std::vector<std::string> substitute(const std::map<std::string, std::string> &values) const;

    const std::vector<std::string> &arguments() const;

    /**
     * @brief 模板中用到的占位符
     */
    std::set<std::string> placeholders() const;

private:
    std::vector<std::string> args;
};

/**
 * @brief 读取表示时间或内存限制的字段
 * @param j 包含该字段的 json 对象
 * @param key 字段名
 * @param ceiling 限制的上限
 * @return 字段的值
 * @throw invalid_request 当字段不存在、不是正整数或者超过 ceiling
 */
int64_t parse_limit(const nlohmann::json &j, const std::string &key, int64_t ceiling);

/**
 * @brief 编译选项
 */
struct compile_config {
    /**
     * @brief 源代码的文件名，比如 main.cpp
     */
    std::string src_name;

    /**
     * @brief 编译出的可执行文件的文件名，比如 main
     */
    std::string exe_name;

    /**
     * @brief 编译器的 CPU 时间限制（毫秒）
     */
    int64_t max_cpu_time;

    /**
     * @brief 编译器的时钟时间限制（毫秒）
     */
    int64_t max_real_time;

    /**
     * @brief 编译器的内存限制（字节）
     */
    int64_t max_memory;

    command_template compile_command;

    /**
     * @throw invalid_request 当配置不合法时
     */
    static compile_config parse(const nlohmann::json &j);
};

/**
 * @brief 运行选项
 */
struct run_config {
    command_template command;

    /**
     * @brief runguard 的系统调用规则，为空表示不限制
     */
    std::string seccomp_rule;

    /**
     * @brief 额外的环境变量，格式为 KEY=VALUE
     */
    std::vector<std::string> env;

    /**
     * @brief 为真时只在程序退出后检查内存峰值，不在运行时限制内存分配
     * 用于 Java 等虚拟机在启动时就分配大量内存的语言
     */
    bool memory_limit_check_only = false;

    /**
     * @brief 没有编译选项时源代码保存的文件名
     */
    std::string exe_name = "main";

    /**
     * @throw invalid_request 当配置不合法时
     */
    static run_config parse(const nlohmann::json &j);
};

/**
 * @brief 语言配置
 */
struct language_config {
    /**
     * @brief 编译选项，为空表示解释型语言，源代码直接作为可执行文件运行
     */
    std::optional<compile_config> compile;

    run_config run;

    static language_config parse(const nlohmann::json &j);
};

/**
 * @brief special judge 的运行选项
 */
struct spj_config {
    std::string exe_name;
    command_template command;
    std::string seccomp_rule;

    static spj_config parse(const nlohmann::json &j);
};

/**
 * @brief 将名字中的 {spj_version} 替换为 special judge 的版本号
 * 比如 "spj-{spj_version}.cpp"
 */
std::string expand_spj_version(const std::string &name, const std::string &version);

}  // namespace judged
