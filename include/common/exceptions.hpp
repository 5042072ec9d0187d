#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>

namespace judged {

struct judge_exception : std::exception {
    judge_exception();
    explicit judge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    const char *what() const noexcept override;

    /**
     * @brief 返回给调用方的错误名称，即响应中的 err 字段
     */
    virtual const char *error_name() const noexcept;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 一般是沙箱无法启动或者文件系统出错
 */
struct internal_error : public judge_exception {
    using judge_exception::judge_exception;
};

/**
 * @brief 请求的 X-Judge-Server-Token 与令牌摘要不一致
 */
struct token_verification_failed : public judge_exception {
    token_verification_failed();
    const char *error_name() const noexcept override;
};

/**
 * @brief 请求的格式错误或者参数不合法，此时不会执行任何程序
 */
struct invalid_request : public judge_exception {
    using judge_exception::judge_exception;
    const char *error_name() const noexcept override;
};

/**
 * @brief 选手程序编译失败
 * what() 为编译器的输出
 */
struct compilation_error : public judge_exception {
    using judge_exception::judge_exception;
    const char *error_name() const noexcept override;
};

/**
 * @brief special judge 编译失败，或者请求的 special judge 版本还未编译
 */
struct spj_compilation_error : public judge_exception {
    using judge_exception::judge_exception;
    const char *error_name() const noexcept override;
};

/**
 * @brief 评测被取消，一般是评测服务端正在退出
 */
struct judge_cancelled : public judge_exception {
    judge_cancelled();
};

}  // namespace judged
