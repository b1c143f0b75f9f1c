#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include "common/utils.hpp"
#include "container/manager.hpp"
#include "engine/execution.hpp"

namespace executor {

/**
 * @brief 执行引擎的参数
 */
struct engine_options {
    /**
     * @brief 存放所有工作目录的根目录
     */
    std::filesystem::path workspace_root;

    /**
     * @brief 容器内的工作目录，提交的文件会被传输到这里
     */
    std::string container_workdir = "/workspace";

    resource_limits limits;

    /**
     * @brief 线程池大小
     */
    std::size_t workers = 4;

    /**
     * @brief 批量测试模式下，是否在编译前执行语言的预安装命令
     */
    bool provision = false;

    /**
     * @brief 批量测试模式下容器入口命令保持运行的时间
     * @note 单位为秒，应当大于编译和所有测试的总时间
     */
    int keepalive_seconds = 3600;
};

/**
 * @brief 一个请求的处理状态，负责检查状态迁移并记录日志
 * 状态只能向前迁移：结束状态（COMPLETED、TIMED_OUT、SETUP_FAILED）之后只能进入
 * CLEANED_UP，任何非终止状态都可以直接进入 CLEANED_UP。
 */
struct request_context {
    void bind_workspace(const std::string &id);

    void bind_container(const std::string &id);

    /**
     * @brief 迁移到 next 状态
     * @throw internal_error 若迁移不合法
     */
    void transition(execution_state next);

    execution_state state() const;

private:
    std::string workspace_id;
    std::string container_id;
    execution_state current = execution_state::INIT;
};

/**
 * @brief 执行引擎
 * 每个请求独立处理，多个线程可以同时调用 execute。请求之间只共享容器运行时和线程池。
 *
 * 两种模式：
 * 1. 单次运行模式（没有测试数据）：容器的入口命令即编译并运行程序，等待容器退出后读取输出。
 * 2. 批量测试模式：只启动一个长时间运行的容器，传输一次文件，编译一次，之后在这个容器内
 *    依次运行每个测试。测试之间共享编译产物和工作目录，因此必须串行执行。
 */
struct execution_engine {
    /**
     * @param runtime 容器运行时，由引擎独占
     * @param options 引擎参数
     */
    execution_engine(std::unique_ptr<container_runtime> runtime, const engine_options &options);

    /**
     * @brief 处理一个请求
     * 容器错误、超时、程序运行错误、内部错误都会转换成正常的执行结果返回。
     * 工作目录和容器在返回前一定会被删除。
     * @throw unsupported_language_error 若无法确定语言，此时不会创建任何容器
     * @throw workspace_io_error 若无法写入提交的文件，此时不会创建任何容器
     * @throw std::invalid_argument 若 timeout_seconds 不是正数
     */
    execution_result execute(const execution_request &request);

    /**
     * @brief 检查容器运行时是否可用
     */
    bool healthy();

private:
    engine_options options;
    container_manager manager;

    container_spec make_spec(const workspace &ws, const std::vector<std::string> &command) const;

    execution_result run_single(const execution_request &request, const workspace &ws, request_context &ctx, const elapsed_time &timer);

    execution_result run_test_suite(const execution_request &request, workspace &ws, request_context &ctx, const elapsed_time &timer);
};

}  // namespace executor
