#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "container/runtime.hpp"

namespace executor {

/**
 * @brief Docker Engine API 的一次 HTTP 响应
 */
struct docker_response {
    long status = 0;
    std::string body;
};

/**
 * @brief 生成 POST /containers/create 的请求体
 */
nlohmann::json build_create_body(const container_spec &spec);

/**
 * @brief 拆分 Docker 的多路复用输出流
 * 没有分配 TTY 时，logs 和 exec 的输出由若干帧组成，每帧有 8 字节的头部：
 * 第 0 字节为流编号（1 为 stdout，2 为 stderr），第 4~7 字节为大端序的帧长度。
 * 若数据不是合法的多路复用格式，剩余内容全部视为 stdout。
 * @param raw 原始字节流
 * @param out 追加 stdout 的内容
 * @param err 追加 stderr 的内容
 */
void demultiplex_stream(const std::string &raw, std::string &out, std::string &err);

/**
 * @brief 对 URL 的查询参数进行百分号编码
 */
std::string url_encode(const std::string &value);

/**
 * @brief 通过 unix socket 调用 Docker Engine API 的容器运行时
 * 每次调用都使用独立的 curl 句柄，因此可以在多个线程中同时使用。
 */
struct docker_runtime : public container_runtime {
    /**
     * @param socket_path Docker 守护进程的 unix socket，接受 unix:// 前缀
     * @param api_version API 版本，比如 v1.41
     * @param pull_images 创建容器时若镜像不存在是否拉取镜像
     */
    docker_runtime(const std::string &socket_path, const std::string &api_version, bool pull_images);

    std::string create(const container_spec &spec) override;

    void put_archive(const std::string &id, const std::filesystem::path &dir, const std::string &dest) override;

    void start(const std::string &id) override;

    int wait(const std::string &id) override;

    process_output logs(const std::string &id) override;

    process_output exec(const std::string &id, const std::vector<std::string> &command) override;

    void kill(const std::string &id) override;

    void terminate_processes(const std::string &id) override;

    void remove(const std::string &id) override;

    bool ping() override;

    /**
     * @brief 拉取镜像，阻塞直到拉取完成
     * @param image 镜像名，可以带标签，比如 python:3.12-slim
     */
    void pull(const std::string &image);

private:
    std::string socket_path;
    std::string api_version;
    bool pull_images;

    docker_response request(const std::string &method, const std::string &path, const std::string &body = "", const std::string &content_type = "application/json");

    nlohmann::json request_json(const std::string &method, const std::string &path, const nlohmann::json &body, long expected_status);
};

}  // namespace executor
