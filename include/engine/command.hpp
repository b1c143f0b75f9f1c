#pragma once

#include <string>
#include <vector>

namespace executor {

/**
 * @brief 将参数用单引号包裹，使其可以原样出现在 sh 命令行中
 * 参数中的单引号被替换为 '\''
 */
std::string shell_quote(const std::string &arg);

/**
 * @brief 在容器内执行的 shell 命令
 * 由工作目录和若干步骤组成，步骤之间用 && 连接，前一步失败时不会执行后面的步骤。
 * 所有参数都经过 shell_quote，用户可以控制的内容（比如测试输入）不会被 shell 解释。
 *
 * @code{.cpp}
 *     shell_command cmd;
 *     cmd.in_directory("/workspace")
 *         .then({"javac", "Main.java"})
 *         .then({"java", "-cp", ".", "Main"});
 *     // /bin/sh -c "cd '/workspace' && 'javac' 'Main.java' && 'java' '-cp' '.' 'Main'"
 *     cmd.argv();
 * @endcode
 */
struct shell_command {
    /**
     * @brief 执行之前切换到的目录
     */
    shell_command &in_directory(const std::string &dir);

    /**
     * @brief 追加一个步骤
     * @param args 程序名和参数
     */
    shell_command &then(const std::vector<std::string> &args);

    /**
     * @brief 将最后一个步骤的 stderr 合并到 stdout
     */
    shell_command &merge_stderr();

    /**
     * @brief 将 input 作为最后一个步骤的标准输入
     * input 先编码为 base64 写进命令行，在容器内用 base64 -d 解码后通过管道传给程序，
     * 因此任意字节（包括引号、换行、NUL）都能原样到达程序。
     */
    shell_command &with_stdin(const std::string &input);

    /**
     * @brief 将容器内的文件 path（相对于工作目录）重定向为最后一个步骤的标准输入
     */
    shell_command &with_stdin_file(const std::string &path);

    bool empty() const;

    /**
     * @brief 生成传给 sh -c 的脚本
     */
    std::string script() const;

    /**
     * @brief 生成完整的 argv：/bin/sh -c <script>
     */
    std::vector<std::string> argv() const;

private:
    struct step {
        std::vector<std::string> args;
        bool merge_stderr = false;
        bool has_stdin = false;
        std::string stdin_base64;
        std::string stdin_file;
    };

    std::string workdir;
    std::vector<step> steps;
};

}  // namespace executor
