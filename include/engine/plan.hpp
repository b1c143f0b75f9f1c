#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "engine/command.hpp"
#include "language.hpp"

namespace executor {

/**
 * @brief 可以直接写进命令行的最大测试输入（字节）
 * 编码后的 base64 必须小于内核对单个参数的限制 MAX_ARG_STRLEN (128 KiB)，
 * 更大的输入以文件的形式随工作目录一起传输到容器中。
 */
constexpr std::size_t MAX_INLINE_STDIN = 64 * 1024;

/**
 * @brief 一种语言在容器内的编译和运行方式
 *
 * | 语言        | 单次运行                          | 编译                      | 运行命令                   |
 * | ----------- | --------------------------------- | ------------------------- | -------------------------- |
 * | python      | python main.py                    | 无                        | python main.py             |
 * | typescript  | tsc *.ts 2>&1 && node main.js     | tsc *.ts                  | node main.js               |
 * | (主文件 .js)| node main.js                      | 无                        | node main.js               |
 * | go          | go run main.go                    | go build -o main_bin      | ./main_bin                 |
 * | java        | javac Main.java && java -cp . Main| javac Main.java           | java -cp . Main            |
 */
struct run_plan {
    /**
     * @brief 单次运行模式下容器的入口命令，编译和运行在同一个 shell 中完成
     */
    shell_command single_run;

    /**
     * @brief 批量测试模式下的编译命令，解释型语言为空
     */
    shell_command build;

    /**
     * @brief 批量测试模式下每个测试使用的运行命令（可执行文件、类名或编译后的脚本）
     */
    std::vector<std::string> runner;

    /**
     * @brief 生成运行一个测试的命令，input 通过 base64 传给 runner 的标准输入
     */
    shell_command test(const std::string &input) const;

    /**
     * @brief 生成运行一个测试的命令，标准输入来自容器内的文件 path（相对于工作目录）
     */
    shell_command test_from_file(const std::string &path) const;

    /**
     * @brief 容器内的工作目录
     */
    std::string workdir;
};

/**
 * @brief 生成运行计划
 * @param lang 实际使用的语言
 * @param main_file 主文件相对于工作目录的路径
 * @param files 工作目录内所有文件的相对路径，TypeScript 会编译其中所有的 .ts 文件
 * @param workdir 容器内的工作目录
 */
run_plan make_run_plan(language lang, const std::string &main_file, const std::vector<std::string> &files, const std::string &workdir);

}  // namespace executor
