#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "engine/execution.hpp"

/**
 * 这个头文件包含执行请求和执行结果的 JSON 编码
 *
 * 请求：
 * {
 *   "language": "python",
 *   "files": { "main.py": "print(input())" },
 *   "timeout": 30,
 *   "test_cases": [ { "input": "hello", "output": "hello" } ]
 * }
 *
 * 结果：
 * {
 *   "stdout": "...", "stderr": "...", "exit_code": 0, "duration_ms": 12,
 *   "test_results": [ { "test_index": 1, "input": "...", "expected_output": "...",
 *                       "actual_output": "...", "passed": true, "exit_code": 0, "duration_ms": 5 } ] | null,
 *   "verdict": "ACCEPTED" | "WRONG ANSWER" | null
 * }
 */
namespace executor {

/**
 * @brief 解析执行请求
 * files 对象保持提交时的顺序，语言识别依赖这个顺序
 * @param default_timeout 请求没有提供 timeout 时使用的超时时间
 * @throw std::invalid_argument 若请求格式不正确
 */
execution_request parse_request(const nlohmann::ordered_json &j, int default_timeout);

/**
 * @brief 解析 JSON 文本形式的执行请求
 * @throw std::invalid_argument 若不是合法的 JSON 或者请求格式不正确
 */
execution_request parse_request(const std::string &text, int default_timeout);

nlohmann::ordered_json to_json(const execution_result &result);

/**
 * @brief 生成错误信封 {"error": message, "kind": kind}
 * 用于无法得到执行结果的请求（语言不支持、文件无法写入、请求格式错误）
 */
nlohmann::ordered_json error_envelope(const std::string &message, const std::string &kind);

}  // namespace executor
