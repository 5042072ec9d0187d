#pragma once

#include <filesystem>
#include <string>

namespace judged {

/**
 * @brief 读取文件的全部内容
 * @param path 文件路径
 * @return 文件的内容(没有指定编码)
 * @throw std::system_error 当文件无法打开时
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文件的全部内容
 * @param path 文件路径
 * @param def 若文件不存在，返回 def
 */
std::string read_file_content(const std::filesystem::path &path, const std::string &def);

/**
 * @brief 读取文件的前 limit 个字节
 */
std::string read_file_content(const std::filesystem::path &path, size_t limit);

/**
 * @brief 覆盖写入文件
 * @throw std::system_error 当文件无法写入时
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 是一个普通的文件名
 * 这里用于确保计算目录时不会出现目录遍历攻击，由于评测系统
 * 运行时需要 root 权限，如果拿到的文件名包含 "/" 或者就是 ".."，那么
 * 最后有可能导致系统重要文件被覆盖或泄露。
 * @param subpath 被检查的文件名
 * @return subpath
 * @throw invalid_request 当 subpath 不安全时
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 在 parent 下创建一个名字为随机 uuid 的新文件夹
 * @return 新文件夹的路径
 */
std::filesystem::path make_unique_directory(const std::filesystem::path &parent);

/**
 * @brief 修改文件或文件夹的所有者，用户或组不存在时抛出异常
 */
void change_owner(const std::filesystem::path &path, const std::string &user, const std::string &group);

/**
 * @brief 创建一个属于指定用户的新文件夹，作为沙箱内程序唯一可写的目录
 * @throw internal_error 文件夹已经存在时
 */
std::filesystem::path make_owned_directory(const std::filesystem::path &path, const std::string &user, const std::string &group);

/**
 * @brief 将文件夹及其内容的所有者改回评测服务端自己，并去掉其他用户的写权限
 * 编译产物会被多次运行复用，不能让选手程序以运行用户的身份修改
 */
void seal_directory(const std::filesystem::path &dir);

/**
 * @brief 删除文件夹，DEBUG 模式下保留以便检查
 * 不会抛出异常，失败时只记录日志
 */
void remove_directory(const std::filesystem::path &dir) noexcept;

/**
 * @brief 删除文件夹内的所有内容，但保留文件夹本身
 */
void clear_directory(const std::filesystem::path &dir);

}  // namespace judged
