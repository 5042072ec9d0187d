#pragma once

#include <string>

namespace judged {

/**
 * @brief 计算令牌的摘要，即请求中 X-Judge-Server-Token 应携带的值
 */
std::string token_digest(const std::string &token);

/**
 * @brief 检查请求携带的令牌摘要
 * 比较时间与内容无关
 * @param provided 请求中的 X-Judge-Server-Token
 * @throw token_verification_failed 当摘要不一致或者服务端没有配置令牌时
 */
void verify_token(const std::string &provided);

}  // namespace judged
