#pragma once

#include <string>

namespace judged {

/**
 * @brief 计算 sha256 摘要
 * @return 小写的十六进制字符串
 */
std::string sha256_hex(const std::string &data);

/**
 * @brief 计算 md5 摘要，用于 ExecutionResult 的 output_md5
 * @return 小写的十六进制字符串
 */
std::string md5_hex(const std::string &data);

/**
 * @brief 常数时间的字符串比较，比较时间只与长度有关
 */
bool secure_equals(const std::string &a, const std::string &b);

}  // namespace judged
