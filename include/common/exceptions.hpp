#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace executor {

struct executor_exception : std::exception {
    explicit executor_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const executor_exception &ex);

    const char *what() const noexcept override;

    /**
     * @brief 错误种类的名字，用于向调用方返回错误信封中的 kind 字段
     */
    virtual const char *kind() const noexcept;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示提交的语言（或根据扩展名推断出的语言）没有对应的运行环境
 * 在创建任何容器之前抛出，调用方将收到错误而不是执行结果
 */
struct unsupported_language_error : public executor_exception {
    explicit unsupported_language_error(const std::string &language);

    const char *kind() const noexcept override;
};

/**
 * @brief 表示无法将提交的文件写入工作目录
 * 包括文件名不安全（绝对路径或含有 ..）、提交中没有文件、磁盘写入失败
 */
struct workspace_io_error : public executor_exception {
    explicit workspace_io_error(const std::string &message);

    const char *kind() const noexcept override;
};

/**
 * @brief 表示容器创建、文件传输、启动失败
 * 该错误不会传递给调用方，执行引擎会把它转换成 exit_code = -1 的执行结果
 */
struct container_setup_error : public executor_exception {
    explicit container_setup_error(const std::string &message);

    const char *kind() const noexcept override;
};

/**
 * @brief 表示 Docker Engine API 调用失败
 * status 为 HTTP 状态码，若请求本身没有发出（比如 socket 不存在）则为 0
 */
struct docker_error : public executor_exception {
    const long status;

    docker_error(const std::string &message, long status);

    const char *kind() const noexcept override;
};

/**
 * @brief 表示执行系统的内部错误
 */
struct internal_error : public executor_exception {
    explicit internal_error(const std::string &message);

    const char *kind() const noexcept override;
};

}  // namespace executor
