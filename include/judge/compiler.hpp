#pragma once

#include <filesystem>
#include <string>
#include "common/messages.hpp"
#include "judge/cancellation.hpp"
#include "judge/language.hpp"

namespace judged {

/**
 * @brief 编译出的可执行文件
 */
struct compile_artifact {
    std::filesystem::path exe_path;
    std::filesystem::path exe_dir;
};

/**
 * @brief 编译源代码
 * 源代码写入 workdir/build/src_name，编译器在沙箱中以编译选项的限制运行，
 * 工作目录为 workdir/build，这是编译器唯一可写的目录。stdout 和 stderr 由 runguard
 * 保存在 workdir 的 compile.out 和 compile.err 中。编译结束后 build 目录的所有权
 * 被收回，可执行文件对运行用户只读。
 * 必须在 worker 中调用。
 *
 * @param source 源代码
 * @param config 编译选项，src_name 和 exe_name 中的 {spj_version} 应当已经被替换
 * @param workdir 编译目录，必须已经存在且属于评测服务端
 * @param ctx 当前 worker 的上下文
 * @param token 当前调用的取消令牌
 * @return 编译出的可执行文件
 * @throw compilation_error 当编译器返回值不为 0、超出限制或者没有生成可执行文件时，what() 为编译器的输出
 * @throw internal_error 当沙箱无法运行编译器时
 * @throw judge_cancelled 当调用被取消时
 */
compile_artifact compile(const std::string &source, const compile_config &config,
                         const std::filesystem::path &workdir, const task_context &ctx, cancellation &token);

}  // namespace judged
