#pragma once

#include <cstdint>
#include <filesystem>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include "common/messages.hpp"
#include "judge/cancellation.hpp"
#include "judge/classifier.hpp"
#include "judge/compiler.hpp"
#include "judge/language.hpp"

namespace judged {

/**
 * @brief 一个编译好的 special judge
 * 被缓存淘汰且没有评测在使用时删除编译目录
 */
struct spj_artifact {
    spj_artifact(const std::string &hash, const std::string &version, const std::filesystem::path &dir, const compile_artifact &artifact);
    ~spj_artifact();

    spj_artifact(const spj_artifact &) = delete;
    spj_artifact &operator=(const spj_artifact &) = delete;

    /**
     * @brief special judge 源代码的 sha256
     */
    const std::string hash;

    const std::string version;

    /**
     * @brief 编译目录，SPJ_DIR/[version]-[sha256 前 16 位]-[序号]
     */
    const std::filesystem::path dir;

    const compile_artifact artifact;
};

/**
 * @brief 编译好的 special judge 的缓存
 * 以 (源代码的 sha256, 版本号) 为键，容量有限，超出容量时淘汰最久未使用的。
 * 同一个版本号或者同一份源代码重新编译时，旧的缓存项会被淘汰。
 * 缓存由评测服务端持有，服务端重启后缓存清空。
 */
struct spj_cache {
    spj_cache(const std::filesystem::path &root, size_t capacity);

    /**
     * @brief 查找缓存，命中时更新最近使用时间
     * @return 找不到时返回空
     */
    std::shared_ptr<spj_artifact> find(const std::string &hash, const std::string &version);

    /**
     * @brief 根据版本号查找缓存，用于请求只提供了 spj_version 的情况
     */
    std::shared_ptr<spj_artifact> find_version(const std::string &version);

    /**
     * @brief 加入缓存
     * 淘汰版本号相同或者源代码相同的旧缓存项，超出容量时淘汰最久未使用的缓存项
     */
    void insert(const std::shared_ptr<spj_artifact> &artifact);

    /**
     * @brief 为新编译的 special judge 分配编译目录
     * 被淘汰的缓存项可能还在被评测使用，因此每次编译都使用新的目录
     */
    std::filesystem::path next_directory(const std::string &hash, const std::string &version);

    size_t size() const;

    /**
     * @brief 同一时间只允许编译一个 special judge，避免两个请求同时编译到同一个目录
     */
    std::mutex compile_mutex;

private:
    mutable std::mutex mut;
    std::filesystem::path root;
    size_t capacity;
    size_t sequence = 0;

    /**
     * @brief 最近使用的在前面
     */
    std::list<std::shared_ptr<spj_artifact>> entries;
};

/**
 * @brief 编译 special judge，缓存命中时直接返回
 * 必须在 worker 中调用。
 * @param cache special judge 缓存
 * @param src special judge 的源代码
 * @param version special judge 的版本号
 * @param config 编译选项，文件名中的 {spj_version} 会被替换为版本号
 * @throw spj_compilation_error 当编译失败时
 */
std::shared_ptr<spj_artifact> compile_spj(spj_cache &cache, const std::string &src, const std::string &version,
                                          const compile_config &config, const task_context &ctx, cancellation &token);

/**
 * @brief special judge 运行时需要的文件
 */
struct spj_files {
    /**
     * @brief 运行目录，属于评测服务端，special judge 的输出和 meta 文件保存在这里
     * special judge 的工作目录是其中新建的 spj 子目录
     */
    std::filesystem::path work_dir;

    std::filesystem::path input;
    std::filesystem::path user_output;

    /**
     * @brief 标准输出，测试数据没有标准输出时为空文件
     */
    std::filesystem::path answer;
};

/**
 * @brief 在沙箱中运行 special judge
 * CPU 时间限制为 max_cpu_time * SPJ_TIME_FACTOR，内存限制为 SPJ_MEMORY_LIMIT
 * @param max_cpu_time 选手程序的 CPU 时间限制（毫秒）
 */
spj_verdict run_spj(const spj_artifact &spj, const spj_config &config, const spj_files &files,
                    int64_t max_cpu_time, const task_context &ctx, cancellation &token);

}  // namespace judged
