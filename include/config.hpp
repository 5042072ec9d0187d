#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace judged {

/**
 * @brief 评测服务端的版本号，由 ping 返回
 */
extern const char *VERSION;

/**
 * @brief runguard 可执行文件的路径
 */
extern std::filesystem::path RUNGUARD;

/**
 * @brief 选手程序编译及运行的根目录，只存放正在评测的文件，评测完成后将被删除
 * 若将这个文件夹放进内存盘，可以加速选手程序的 IO 性能。
 * 评测服务端启动时会清空这个文件夹中上次崩溃遗留的文件。
 *
 * RUN_DIR
 * ├── 3c2a0c9e-... // 一次 judge 调用的目录，随机生成的 uuid
 * │   ├── compile // 选手程序的代码和编译目录
 * │   │   ├── main.cpp // 选手程序的代码（src_name）
 * │   │   ├── main // 编译出的可执行文件（exe_name）
 * │   │   ├── compile.out // 编译器的 stdout 输出
 * │   │   ├── compile.err // 编译器的 stderr 输出
 * │   │   └── compile.meta // 编译器的运行信息
 * │   ├── 5d1f... // 一个测试数据点的运行目录，随机生成的 uuid
 * │   │   ├── input // 标准输入
 * │   │   ├── output // 选手程序的 stdout 输出
 * │   │   ├── error // 选手程序的 stderr 输出
 * │   │   ├── answer // 标准输出，仅在使用 special judge 时写出
 * │   │   ├── program.meta // 选手程序的运行信息
 * │   │   └── spj.meta // special judge 的运行信息
 * │   └── ...
 * └── ...
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 预先准备好的测试数据的目录
 *
 * TEST_CASE_DIR
 * └── a9f3... // test_case_id
 *     ├── info // 测试数据点列表，json 格式
 *     ├── 1.in
 *     ├── 1.out
 *     └── ...
 */
extern std::filesystem::path TEST_CASE_DIR;

/**
 * @brief 编译好的 special judge 的缓存目录
 *
 * SPJ_DIR
 * └── [version]-[sha256 前 16 位]-[序号] // 一个 special judge 的编译目录
 */
extern std::filesystem::path SPJ_DIR;

/**
 * @brief 运行选手程序、编译器和 special judge 的用户和组
 * 必须是一个没有任何权限的用户
 */
extern std::string RUN_USER;
extern std::string RUN_GROUP;

/**
 * @brief 请求中 X-Judge-Server-Token 应该携带的值，即令牌的 sha256 十六进制摘要
 */
extern std::string TOKEN_DIGEST;

/**
 * @brief 请求可以设置的最大 CPU 时间（毫秒）和最大内存（字节）
 */
extern int64_t MAX_CPU_TIME_CEILING;
extern int64_t MAX_MEMORY_CEILING;

/**
 * @brief 编译器可以设置的最大 CPU 时间、时钟时间（毫秒）和内存（字节）
 */
extern int64_t MAX_COMPILE_CPU_TIME_CEILING;
extern int64_t MAX_COMPILE_REAL_TIME_CEILING;
extern int64_t MAX_COMPILE_MEMORY_CEILING;

/**
 * @brief 时钟时间限制与 CPU 时间限制的比例
 * 选手程序的时钟时间限制为 max_cpu_time * REAL_TIME_FACTOR，从 runguard 创建子进程时开始计时
 */
extern int REAL_TIME_FACTOR;

/**
 * @brief 选手程序 stdout 和 stderr 的最大长度（字节），超出的部分会被丢弃并判为运行错误
 */
extern int64_t OUTPUT_LIMIT;

/**
 * @brief 编译器输出的最大长度（字节），超出的部分会被截断
 */
extern int64_t COMPILE_OUTPUT_LIMIT;

/**
 * @brief 选手程序能创建的最大文件大小（字节）
 */
extern int64_t FILE_LIMIT;

/**
 * @brief 选手程序同时存在的最大进程数
 */
extern size_t PROCESS_LIMIT;

/**
 * @brief special judge 的时间限制为 max_cpu_time * SPJ_TIME_FACTOR
 */
extern int SPJ_TIME_FACTOR;

/**
 * @brief special judge 的内存限制（字节）
 */
extern int64_t SPJ_MEMORY_LIMIT;

/**
 * @brief 最多缓存多少个编译好的 special judge
 */
extern size_t SPJ_CACHE_SIZE;

enum class compare_mode {
    /**
     * @brief 忽略行末空白字符（空格、制表符、\r）和文末空行
     */
    IGNORE_TRAILING_SPACE,

    /**
     * @brief 逐字节比较
     */
    EXACT
};

extern compare_mode COMPARE_MODE;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，评测系统将不再检查程序是否在特权模式下执行，
 * 并且不会删除产生的评测目录，以便手动检查测试产生的文件内容是否符合预期。
 */
extern bool DEBUG;

}  // namespace judged
