#pragma once

#include <string>
#include <vector>
#include "container/runtime.hpp"
#include "engine/execution.hpp"

/**
 * 将执行过程中收集的数据组装成 execution_result，没有副作用
 */
namespace executor {

/**
 * @brief 超时时返回给调用方的错误信息
 */
std::string timeout_message(int timeout_seconds);

/**
 * @brief 单次运行模式正常结束
 * 只有在返回值非 0 且 stderr 不全为空白字符时才返回 stderr，
 * 避免编译器在运行成功时的警告被当成错误。
 */
execution_result report_completion(const process_output &output, long long duration_ms);

/**
 * @brief 单次运行模式超时
 */
execution_result report_timeout(int timeout_seconds, long long duration_ms);

/**
 * @brief 容器错误或者内部错误
 * @param message 返回给调用方的 stderr
 */
execution_result report_failure(const std::string &message, long long duration_ms);

/**
 * @brief 根据所有测试结果计算评测结果，全部通过为 ACCEPTED
 */
verdict judge_verdict(const std::vector<test_result> &results);

/**
 * @brief 生成批量测试的文字报告
 * Verdict: ACCEPTED
 * Passed: 2/2
 *
 * [PASS] Test 1: 2 (expected: 2)
 * [PASS] Test 2: 4 (expected: 4)
 */
std::string format_transcript(verdict v, const std::vector<test_result> &results);

/**
 * @brief 批量测试模式结束
 * @param results 所有测试的结果
 * @param first_error 第一个产生 stderr 输出的测试的 stderr，没有全部通过时作为请求的 stderr 返回
 */
execution_result report_test_suite(std::vector<test_result> results, const std::string &first_error, long long duration_ms);

}  // namespace executor
