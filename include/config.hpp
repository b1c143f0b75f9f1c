#pragma once

#include <filesystem>
#include <string>

namespace executor {

/**
 * @brief Docker 守护进程的 unix socket 路径
 * 可以通过 --docker-host 或环境变量 DOCKER_HOST 指定，接受 unix:// 前缀
 */
extern std::string DOCKER_HOST;

/**
 * @brief 调用的 Docker Engine API 版本，会作为 URL 前缀，比如 /v1.41/containers/create
 */
extern std::string DOCKER_API_VERSION;

/**
 * @brief 存放提交文件的根目录
 * 每个请求在这里创建一个独立的工作目录，请求结束后工作目录会被删除。
 *
 * WORKSPACE_DIR
 * ├── executor_run_0123456789ab // 一个请求的工作目录
 * │   ├── main.py // 提交的文件，保持提交时的相对路径
 * │   └── lib
 * │       └── util.py
 * ├── executor_run_0123456789ab.tar // 传输给容器的临时压缩包，传输完成后删除
 * └── ...
 */
extern std::filesystem::path WORKSPACE_DIR;

/**
 * @brief 容器内存限制
 * @note 单位为 MiB
 */
extern int MEMORY_LIMIT;

/**
 * @brief 容器 CPU 配额，CPU_QUOTA / CPU_PERIOD 为可用的核心数
 * 默认 50000 / 100000，即一个核心的 50%
 * @note 单位为微秒
 */
extern int CPU_PERIOD;

extern int CPU_QUOTA;

/**
 * @brief 执行容器运行时调用的线程池大小
 */
extern int WORKER_THREADS;

/**
 * @brief 请求没有提供 timeout 时使用的超时时间
 * @note 单位为秒
 */
extern int DEFAULT_TIMEOUT;

/**
 * @brief 创建容器时若镜像不存在，是否先拉取镜像
 */
extern bool PULL_IMAGES;

/**
 * @brief 批量测试模式下，是否在编译前执行语言的预安装命令
 */
extern bool PROVISION_TOOLCHAINS;

/**
 * @brief 是否开启 DEBUG 模式
 * 开启后输出每个请求的状态迁移以及容器运行时的调用
 */
extern bool DEBUG;

}  // namespace executor
