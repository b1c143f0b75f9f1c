#pragma once

#include <string>
#include <vector>

/**
 * 这个头文件包含支持的编程语言以及每种语言的运行环境
 * 新增语言时需要在 language 中新增枚举值，编译器会在所有
 * switch (language) 的地方提示没有处理新语言的分支。
 */
namespace executor {

enum class language {
    python,
    typescript,
    go,
    java
};

/**
 * @brief 表示一种语言的运行环境，进程内只读
 */
struct language_profile {
    /**
     * @brief 运行代码的容器镜像
     */
    std::string image;

    /**
     * @brief 约定的主文件名，只作为命名提示，实际的主文件由 workspace 决定
     */
    std::string main_file;

    /**
     * @brief 源文件扩展名，第一个为主扩展名
     * TypeScript 同时接受 .ts 和 .js
     */
    std::vector<std::string> extensions;

    /**
     * @brief 预安装命令，为空表示不需要
     * 在开启 PROVISION_TOOLCHAINS 时，批量测试模式会在编译前执行一次
     */
    std::vector<std::string> provision_command;

    /**
     * @brief 运行时是否需要访问外部网络
     * 只有在运行时需要下载工具链的语言才需要（TypeScript 通过 npx 下载 tsc）
     */
    bool requires_network;
};

/**
 * @brief 获取语言的运行环境
 * 返回的引用在进程生命周期内有效
 */
const language_profile &get_language_profile(language lang);

/**
 * @brief 语言在请求中的名字，比如 "python"
 */
const char *get_language_name(language lang);

/**
 * @brief 根据名字查找语言
 * @param name 请求中声明的语言名
 * @param lang 若找到，保存对应的语言
 * @return 是否是支持的语言
 */
bool parse_language(const std::string &name, language &lang);

/**
 * @brief 根据文件扩展名推断语言（扩展名不区分大小写）
 * @param path 文件路径，比如 src/Main.java
 * @param lang 若推断成功，保存推断出的语言
 * @return 是否推断成功
 */
bool detect_language(const std::string &path, language &lang);

/**
 * @brief 判断文件是否是该语言的源文件
 */
bool has_language_extension(const std::string &path, language lang);

}  // namespace executor
