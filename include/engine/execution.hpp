#pragma once

#include <optional>
#include <string>
#include <vector>
#include "workspace.hpp"

/**
 * 这个头文件包含执行请求和执行结果
 * 包含：
 * 1. execution_request 类（表示调用方提交的一次执行）
 * 2. test_case 类（表示一组测试数据）
 * 3. test_result 类（表示一组测试数据的执行结果）
 * 4. execution_result 类（表示返回给调用方的执行结果）
 */
namespace executor {

/**
 * @brief 表示一组测试数据，值类型
 */
struct test_case {
    /**
     * @brief 通过标准输入喂给程序的数据
     */
    std::string input;

    /**
     * @brief 期望的标准输出，比较时会去掉首尾空白字符
     */
    std::string expected_output;
};

/**
 * @brief 调用方提交的一次执行，提交后不再修改
 */
struct execution_request {
    /**
     * @brief 声明的语言名，如果文件扩展名能识别出语言，以扩展名为准
     */
    std::string language;

    /**
     * @brief 提交的文件，保持提交时的顺序
     */
    std::vector<source_file> files;

    /**
     * @brief 超时时间，单次运行模式下为整个运行的期限，批量测试模式下为编译和每个测试各自的期限
     * @note 单位为秒，必须为正数
     */
    int timeout_seconds = 30;

    /**
     * @brief 测试数据，为空时使用单次运行模式，否则使用批量测试模式
     */
    std::vector<test_case> test_cases;
};

/**
 * @brief 一组测试数据的执行结果
 */
struct test_result {
    /**
     * @brief 测试编号，从 1 开始
     */
    std::size_t index = 0;

    std::string input;

    /**
     * @brief 去掉首尾空白字符后的期望输出
     */
    std::string expected_output;

    /**
     * @brief 去掉首尾空白字符后的实际输出
     * 若程序有 stderr 输出或者超时，会在末尾附加一行 "Error: ..."
     */
    std::string actual_output;

    /**
     * @brief 程序正常退出且实际输出与期望输出一致
     */
    bool passed = false;

    /**
     * @brief 程序的返回值，超时时为 -1
     */
    int exit_code = 0;

    long long duration_ms = 0;
};

/**
 * @brief 批量测试的总体评测结果
 */
enum class verdict {
    /**
     * @brief 所有测试都通过
     */
    ACCEPTED,

    /**
     * @brief 至少有一个测试没有通过
     */
    WRONG_ANSWER
};

/**
 * @brief 返回给调用方的评测结果字符串："ACCEPTED" 或 "WRONG ANSWER"
 */
const char *get_display_message(verdict v);

/**
 * @brief 返回给调用方的执行结果
 */
struct execution_result {
    std::string stdout_text;
    std::string stderr_text;

    /**
     * @brief 单次运行模式下为程序的返回值；批量测试模式下全部通过为 0，否则为 1；
     * 超时、容器错误、内部错误时为 -1
     */
    int exit_code = 0;

    long long duration_ms = 0;

    /**
     * @brief 仅在批量测试模式下存在
     */
    std::optional<std::vector<test_result>> test_results;

    /**
     * @brief 仅在批量测试模式下存在
     */
    std::optional<executor::verdict> verdict;
};

/**
 * @brief 一个请求的处理状态
 * INIT → WORKSPACE_READY → CONTAINER_CREATED → POPULATED → RUNNING → {COMPLETED | TIMED_OUT | SETUP_FAILED} → CLEANED_UP
 * 任何非终止状态都可以直接进入 CLEANED_UP，任何状态都不会重复进入。
 */
enum class execution_state {
    INIT = 0,
    WORKSPACE_READY = 1,
    CONTAINER_CREATED = 2,
    POPULATED = 3,
    RUNNING = 4,
    COMPLETED = 5,
    TIMED_OUT = 6,
    SETUP_FAILED = 7,
    CLEANED_UP = 8
};

const char *get_display_message(execution_state state);

}  // namespace executor
