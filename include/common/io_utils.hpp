#pragma once

#include <filesystem>
#include <string>

namespace executor {

/**
 * @brief 读取文件的全部内容
 * @param path 文件路径
 * @return 文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将 content 写入 path，会自动创建不存在的父文件夹
 * @throw std::system_error 若文件夹无法创建或者文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 将字节流按 UTF-8 解码，非法的字节序列替换为 U+FFFD
 * 容器的输出是任意字节，返回给调用方的必须是合法的 UTF-8 文本
 */
std::string utf8_sanitize(const std::string &bytes);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 这里用于确保写入提交的文件时不会出现目录遍历攻击，如果拿到的文件名
 * 包含 ".." 或者是绝对路径，那么最后有可能导致工作目录外的文件被覆盖。
 * @param subpath 被检查的文件名
 * @return subpath 本身
 * @throw std::invalid_argument 若 subpath 不安全
 */
std::string assert_safe_path(const std::string &subpath);

}  // namespace executor
