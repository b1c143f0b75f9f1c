#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "common/thread_pool.hpp"
#include "container/runtime.hpp"

namespace executor {

struct container_manager;

/**
 * @brief 表示一个已经创建的容器，只能移动
 * 析构时若容器还没有被删除，则强制删除容器，因此容器在任何返回路径
 * （包括异常、超时、启动前的失败）下都会被删除，且只删除一次。
 */
struct container {
    container(container &&other);
    container(const container &) = delete;
    container &operator=(const container &) = delete;
    ~container();

    const std::string &id() const;

    /**
     * @brief 容器 id 的前 12 位，用于日志
     */
    std::string short_id() const;

    bool removed() const;

private:
    friend struct container_manager;

    container(container_manager &manager, const std::string &id);

    container_manager *manager;
    std::string cid;
    bool is_removed;
};

/**
 * @brief 容器生命周期管理
 * 容器运行时的调用都是阻塞的，这里把它们分派到固定大小的线程池中执行，
 * 调用方等待 future 完成。超过期限时通过强制停止容器（或者结束容器内
 * 的进程）来中断阻塞的调用，而不是等待它自然结束。
 *
 * 强制停止不经过线程池：当线程池的所有线程都阻塞在等待容器退出时，
 * 强制停止仍然可以执行，从而释放被占用的线程。
 */
struct container_manager {
    /**
     * @param runtime 容器运行时，由 manager 独占
     * @param workers 线程池大小
     */
    container_manager(std::unique_ptr<container_runtime> runtime, size_t workers);

    /**
     * @brief 创建容器但不启动
     * @throw container_setup_error 若镜像不可用或者创建失败
     */
    container create(const container_spec &spec);

    /**
     * @brief 将 dir 内的文件以一个压缩包传输到容器的 dest 目录
     * @throw container_setup_error 若传输失败
     */
    void populate(container &c, const std::filesystem::path &dir, const std::string &dest);

    /**
     * @brief 启动容器的入口命令
     * @throw container_setup_error 若启动失败
     */
    void start(container &c);

    /**
     * @brief 等待容器的入口命令退出
     * @param deadline 最多等待的时间，超过后强制停止容器
     * @param exit_code 入口命令正常退出时保存返回值
     * @return false 若超过期限
     */
    bool await_completion(container &c, std::chrono::milliseconds deadline, int &exit_code);

    /**
     * @brief 获取已退出容器的 stdout、stderr 和返回值
     */
    process_output collect_output(container &c);

    /**
     * @brief 在运行中的容器内执行命令
     * @param deadline 命令开始执行后最多等待的时间，超过后强制结束容器内除入口进程外的所有进程，容器继续运行。
     *                 线程池繁忙时，命令在队列中等待的时间不计入期限
     * @param output 命令正常退出时保存输出
     * @return false 若超过期限
     */
    bool exec(container &c, const std::vector<std::string> &command, std::chrono::milliseconds deadline, process_output &output);

    /**
     * @brief 强制删除容器，可以重复调用，只有第一次调用会访问容器运行时
     * 删除失败时只记录日志，因为这是所有返回路径的最后一步
     */
    void remove(container &c) noexcept;

    /**
     * @brief 检查容器运行时是否可用
     */
    bool ping();

private:
    // 声明顺序保证线程池先于运行时析构
    std::unique_ptr<container_runtime> runtime;
    thread_pool pool;

    /**
     * @brief 被强制停止后，等待阻塞调用返回的最长时间
     */
    std::chrono::milliseconds grace_period{10000};
};

}  // namespace executor
