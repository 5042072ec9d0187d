#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "judge/language.hpp"
#include "judge/test_case.hpp"

namespace judged {

/**
 * @brief 一次 judge 调用的请求
 * 解析请求时完成所有结构检查，解析成功的请求不会因为格式问题在执行中途失败
 */
struct judge_request {
    /**
     * @brief 选手程序的源代码
     */
    std::string src;

    language_config language;

    /**
     * @brief 选手程序的 CPU 时间限制（毫秒）
     */
    int64_t max_cpu_time;

    /**
     * @brief 选手程序的内存限制（字节）
     */
    int64_t max_memory;

    /**
     * @brief 预先准备的测试数据编号，与 test_cases 二选一
     */
    std::optional<std::string> test_case_id;

    /**
     * @brief 请求中直接给出的测试数据
     */
    std::vector<test_case> test_cases;

    /**
     * @brief 是否在结果中返回选手程序的输出
     */
    bool output = false;

    std::optional<std::string> spj_version;
    std::optional<spj_config> spj;
    std::optional<compile_config> spj_compile;
    std::optional<std::string> spj_src;

    bool uses_spj() const;
};

/**
 * @brief 解析 judge 请求
 * @throw invalid_request 当请求格式错误时
 */
judge_request parse_judge_request(const nlohmann::json &j);

/**
 * @brief 一次 compile_spj 调用的请求
 */
struct compile_spj_request {
    std::string src;
    std::string spj_version;
    compile_config config;
};

/**
 * @brief 解析 compile_spj 请求
 * @throw invalid_request 当请求格式错误时
 */
compile_spj_request parse_compile_spj_request(const nlohmann::json &j);

}  // namespace judged
