#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

/**
 * 这个头文件包含容器运行时的抽象接口
 * 执行引擎只通过 container_runtime 访问容器，生产环境使用 docker_runtime
 * （通过 unix socket 调用 Docker Engine API），测试时可以替换为模拟容器行为的实现。
 */
namespace executor {

/**
 * @brief 容器的资源限制
 */
struct resource_limits {
    /**
     * @brief 内存限制
     * @note 单位为字节
     */
    int64_t memory_bytes = 512LL << 20;

    /**
     * @brief CPU 配额，cpu_quota / cpu_period 为可以使用的核心数
     * @note 单位为微秒
     */
    int64_t cpu_period = 100000;
    int64_t cpu_quota = 50000;
};

/**
 * @brief 创建容器所需的全部参数
 */
struct container_spec {
    std::string image;

    /**
     * @brief 容器的入口命令，argv 形式
     */
    std::vector<std::string> command;

    /**
     * @brief 容器内的工作目录，提交的文件会被传输到这里
     */
    std::string workdir;

    std::map<std::string, std::string> env;

    /**
     * @brief 是否允许访问网络，为 false 时容器没有任何网络接口
     */
    bool network_enabled = false;

    resource_limits limits;
};

/**
 * @brief 一次进程执行的输出
 * stdout 和 stderr 分开保存，都已经解码为合法的 UTF-8 文本
 */
struct process_output {
    int exit_code = 0;
    std::string stdout_text;
    std::string stderr_text;
};

/**
 * @brief 容器运行时
 * 所有函数都是阻塞的，而且必须允许多个线程同时调用。
 * 失败时抛出 docker_error 或者 container_setup_error。
 */
struct container_runtime {
    virtual ~container_runtime() = default;

    /**
     * @brief 创建容器但不启动
     * @return 容器 id
     */
    virtual std::string create(const container_spec &spec) = 0;

    /**
     * @brief 将 dir 内的全部文件（保持相对路径）以一个压缩包传输到容器的 dest 目录
     */
    virtual void put_archive(const std::string &id, const std::filesystem::path &dir, const std::string &dest) = 0;

    virtual void start(const std::string &id) = 0;

    /**
     * @brief 阻塞直到容器的入口进程退出
     * @return 入口进程的返回值
     */
    virtual int wait(const std::string &id) = 0;

    /**
     * @brief 获取已经退出的容器的 stdout、stderr 和返回值
     */
    virtual process_output logs(const std::string &id) = 0;

    /**
     * @brief 在运行中的容器内执行命令，阻塞直到命令退出
     */
    virtual process_output exec(const std::string &id, const std::vector<std::string> &command) = 0;

    /**
     * @brief 强制停止容器（SIGKILL），容器已经停止时不做任何事
     */
    virtual void kill(const std::string &id) = 0;

    /**
     * @brief 强制结束容器内除了入口进程以外的所有进程
     * 用于中断超时的 exec，同时保留容器以便继续执行之后的测试
     */
    virtual void terminate_processes(const std::string &id) = 0;

    /**
     * @brief 强制删除容器（包括运行中的容器），容器不存在时不做任何事
     */
    virtual void remove(const std::string &id) = 0;

    /**
     * @brief 检查容器运行时是否可用
     */
    virtual bool ping() = 0;
};

}  // namespace executor
