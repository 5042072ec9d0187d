#pragma once

/**
 * 测试用的评测环境
 * 所有目录都位于 /tmp/judged-test 下，runguard 默认位于测试程序的当前目录，
 * 也可以通过环境变量 RUNGUARD 指定。
 */
namespace judged {

/**
 * @brief 测试使用的令牌，评测服务端的 TOKEN_DIGEST 为其 sha256 摘要
 */
extern const char *TEST_TOKEN;

void setup_test_environment();

/**
 * @brief 是否能够运行沙箱，需要 root 权限以及编译好的 runguard
 * 不能运行沙箱时，需要运行程序的测试会被跳过
 */
bool sandbox_available();

}  // namespace judged
