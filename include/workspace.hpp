#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "language.hpp"

namespace executor {

/**
 * @brief 提交的一个文件
 */
struct source_file {
    /**
     * @brief 相对于工作目录的路径，比如 "main.py" 或 "src/Main.java"
     */
    std::string path;

    std::string content;
};

/**
 * @brief 根据提交的文件确定实际使用的语言和主文件
 * 按提交顺序扫描文件扩展名，第一个能识别的扩展名决定语言，这个文件就是主文件；
 * 没有能识别的扩展名时使用声明的语言，主文件为第一个文件。
 * @param files 按提交顺序排列的文件
 * @param declared 请求中声明的语言名
 * @param lang 实际使用的语言
 * @param main_file 主文件的相对路径
 * @throw unsupported_language_error 若扩展名和声明的语言都无法识别
 * @throw workspace_io_error 若没有提交任何文件
 */
void resolve_language(const std::vector<source_file> &files, const std::string &declared, language &lang, std::string &main_file);

/**
 * @brief 一个请求的临时工作目录
 * 构造时创建目录并写入所有文件，析构时删除整个目录。
 * 构造失败时已经写入的内容也会被删除，因此无论请求成功与否，
 * 工作目录都不会残留在磁盘上。
 *
 * 目录结构参见 WORKSPACE_DIR
 */
struct workspace {
    /**
     * @param root 存放所有工作目录的根目录
     * @param files 提交的文件
     * @param declared_language 请求中声明的语言，会被文件扩展名覆盖
     * @throw unsupported_language_error 在创建任何目录之前抛出
     * @throw workspace_io_error 若文件名不安全或者写入失败
     */
    workspace(const std::filesystem::path &root, const std::vector<source_file> &files, const std::string &declared_language);

    workspace(const workspace &) = delete;
    workspace &operator=(const workspace &) = delete;

    ~workspace();

    /**
     * @brief 工作目录的唯一名字，形如 executor_run_0123456789ab
     */
    const std::string &id() const;

    const std::filesystem::path &dir() const;

    /**
     * @brief 实际使用的语言
     */
    language lang() const;

    /**
     * @brief 主文件相对于工作目录的路径
     */
    const std::string &main_file() const;

    /**
     * @brief 所有写入的文件相对于工作目录的路径，保持提交顺序
     */
    const std::vector<std::string> &files() const;

    /**
     * @brief 在工作目录中写入一个不属于提交的文件，比如过大的测试输入
     * 写入的文件会随工作目录一起传输到容器中，但不会出现在 files() 中
     * @throw workspace_io_error 若 relative 不安全或者写入失败
     */
    void stage_file(const std::string &relative, const std::string &content);

    /**
     * @brief 删除工作目录，可以重复调用
     */
    void destroy() noexcept;

private:
    std::string name;
    std::filesystem::path path;
    language resolved;
    std::string main;
    std::vector<std::string> paths;
    bool destroyed = false;
};

}  // namespace executor
