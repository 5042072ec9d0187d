#pragma once

#include <string>

bool is_number(const std::string &s);

/**
 * @brief 在 PATH 中查找可执行文件
 * 加载 seccomp 后只允许 execve 指定的路径，因此必须在加载前确定完整路径
 * @param file 命令名，含有 '/' 时原样返回
 * @return 可执行文件路径，找不到时原样返回 file，交由 execv 报错
 */
std::string resolve_executable(const std::string &file);
