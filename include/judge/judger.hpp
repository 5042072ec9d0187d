#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "judge/cancellation.hpp"
#include "judge/compiler.hpp"
#include "judge/request.hpp"
#include "judge/spj.hpp"
#include "worker.hpp"

namespace judged {

/**
 * @brief 一个测试数据点的评测结果
 */
struct execution_result {
    /**
     * @brief CPU 时间（毫秒）
     */
    int64_t cpu_time = 0;

    /**
     * @brief 时钟时间（毫秒）
     */
    int64_t real_time = 0;

    /**
     * @brief 内存峰值（字节）
     */
    int64_t memory = 0;

    int signal = 0;
    int exit_code = 0;
    error_kind error = error_kind::SUCCESS;
    result_code result = result_code::SYSTEM_ERROR;

    /**
     * @brief 测试数据点的编号
     */
    std::string test_case;

    /**
     * @brief 删除末尾空白字符后的选手程序输出的 md5
     */
    std::string output_md5;

    /**
     * @brief 选手程序的输出，仅在请求要求时返回
     */
    std::optional<std::string> output;

    nlohmann::json to_json() const;
};

/**
 * @brief 评测逻辑
 * 一次 judge 调用依次进行：读取测试数据、准备 special judge、编译、
 * 并行运行每个测试数据点并判定。编译和运行都作为任务提交到 worker 池中。
 */
struct judger {
    judger(worker_pool &pool, spj_cache &cache);

    /**
     * @brief 评测一个请求
     * @param req 已经通过结构检查的请求
     * @param token 当前调用的取消令牌
     * @return 每个测试数据点的评测结果，与测试数据的顺序一致
     * @throw invalid_request 当测试数据不存在或者格式错误时
     * @throw compilation_error 当选手程序编译失败时
     * @throw spj_compilation_error 当 special judge 编译失败或者还未编译时
     * @throw judge_cancelled 当调用被取消时，此时不返回任何结果
     */
    std::vector<execution_result> judge(const judge_request &req, cancellation &token);

    /**
     * @brief 编译 special judge 并加入缓存
     * @throw spj_compilation_error 当编译失败时
     */
    void compile_spj(const compile_spj_request &req, cancellation &token);

private:
    std::shared_ptr<spj_artifact> prepare_spj(const judge_request &req, cancellation &token);

    compile_artifact prepare_executable(const judge_request &req, const std::filesystem::path &submission_dir, cancellation &token);

    execution_result run_test_case(const judge_request &req, const test_case &tc, const compile_artifact &executable,
                                   const spj_artifact *spj, const std::filesystem::path &submission_dir,
                                   const task_context &ctx, cancellation &token);

    worker_pool &pool;
    spj_cache &cache;
};

}  // namespace judged
