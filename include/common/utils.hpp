#pragma once

#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <chrono>
#include <filesystem>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace executor {

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

template <>
struct to_string_cont<std::filesystem::path> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::filesystem::path &element) {
        cont.push_back(element.string());
    }
};

/**
 * @brief 将参数 args 的内容通过 to_string 转换为字符串并装入容器中
 * @param cont 字符串容器
 * @param args 按顺序 to_string 转换为字符串并装入容器
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, Head &head, Args &... args) {
    to_string_cont<std::decay_t<Head>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

/**
 * @brief 执行外部命令
 * @param env additional environment variables
 * @param args 外部命令的路径 (args[0]) 和 参数
 * @return 外部命令的返回值，如果外部命令因为信号崩溃而没有返回码，则返回 -1
 */
int exec_program(const std::map<std::string, std::string> &env, const std::vector<std::string> &args);

/**
 * @brief 调用外部程序
 * @note 与 system(cmd) 的区别是，这个函数避免了转义导致的安全问题
 * @param args 转送给应用程序的参数列表，比如可以传入 filesystem::path 给 args[0] 来表示应用程序路径
 * @code{.cpp}
 *     std::filesystem::path dir("/tmp/executor/executor_run_0123456789ab");
 *     // 相当于 system("tar -C /tmp/executor/executor_run_0123456789ab -cf /tmp/a.tar .");
 *     int exitcode = call_process("tar", "-C", dir, "-cf", "/tmp/a.tar", ".");
 * @endcode
 */
template <typename... Args>
int call_process_env(std::map<std::string, std::string> const &env, Args &&... args) {
    std::vector<std::string> list;
    to_string_list(list, args...);

    if (VLOG_IS_ON(1)) {
        std::stringstream ss;
        for (auto &arg : list)
            ss << arg << ' ';
        VLOG(1) << ss.str();
    }

    return exec_program(env, list);
}

template <typename... Args>
int call_process(Args &&... args) {
    return call_process_env({}, args...);
}

/**
 * @brief 去掉字符串首尾的空白字符
 */
std::string trim(const std::string &str);

/**
 * @brief 判断字符串是否只包含空白字符（空串也算）
 */
bool is_blank(const std::string &str);

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    long long milliseconds() const;

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace executor
