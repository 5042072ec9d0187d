#pragma once

#include <optional>
#include <string>
#include "common/status.hpp"
#include "config.hpp"
#include "judge/sandbox.hpp"

/**
 * 判定器：根据沙箱的原始结果以及标准输出（或 special judge 的判定）给出评测结果
 * 判定按以下顺序进行，先匹配的优先：
 * 1. CPU 时间超限、时钟时间超限、内存超限
 * 2. 输出超限、调用被禁止的系统调用、被信号终止、返回值不为 0 均为运行错误
 * 3. 沙箱出错为系统错误
 * 4. 比较输出或者采用 special judge 的判定
 * 判定器是纯函数，不修改输入，相同的输入总是得到相同的结果。
 */
namespace judged {

/**
 * @brief special judge 的判定
 */
enum class spj_verdict {
    ACCEPTED,
    WRONG_ANSWER,

    /**
     * @brief special judge 没有以 0 或 1 退出，或者超出了限制
     */
    ERROR
};

struct verdict {
    result_code result;
    error_kind error;
};

/**
 * @brief 只根据程序的运行情况判定，不比较输出
 * @return 若程序运行正常，返回空，需要继续比较输出
 */
std::optional<verdict> classify_execution(const raw_outcome &outcome);

/**
 * @brief 与标准输出比较来判定结果
 */
verdict classify(const raw_outcome &outcome, const std::string &expected, const std::string &actual, compare_mode mode);

/**
 * @brief 根据 special judge 的判定来判定结果
 */
verdict classify(const raw_outcome &outcome, spj_verdict spj);

/**
 * @brief 根据 special judge 的运行结果得到 special judge 的判定
 * 0 表示答案正确，1 表示答案错误，其他情况均为 special judge 出错
 */
spj_verdict to_spj_verdict(const raw_outcome &spj_outcome);

/**
 * @brief 删除每行行末的空格、制表符和 \r，以及文末的空行
 */
std::string normalize_output(const std::string &output);

bool outputs_match(const std::string &expected, const std::string &actual, compare_mode mode);

}  // namespace judged
