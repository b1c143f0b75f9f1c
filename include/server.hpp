#pragma once

#include <iostream>
#include <string>
#include "engine/engine.hpp"

namespace executor {

/**
 * @brief 处理一个 JSON 文本形式的请求，返回结果或者错误信封
 * 请求没有提供 timeout 时使用 DEFAULT_TIMEOUT
 * @param ok 是否得到了执行结果
 */
std::string handle_request(execution_engine &engine, const std::string &text, bool &ok);

/**
 * @brief 逐行读取请求，每行一个 JSON 请求，空行被忽略
 * 最多同时处理 concurrency 个请求，结果按输入顺序逐行写入 out
 */
void serve(execution_engine &engine, std::istream &in, std::ostream &out, std::size_t concurrency);

}  // namespace executor
