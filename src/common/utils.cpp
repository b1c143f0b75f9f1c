#include "common/utils.hpp"
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/trim.hpp>
#include <system_error>

namespace executor {
using namespace std;

int exec_program(const map<string, string> &env, const vector<string> &args) {
    vector<char *> argv;
    for (auto &arg : args)
        argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);

    // 使用 POSIX 提供的函数来实现外部程序调用
    pid_t pid;
    switch (pid = fork()) {
        case -1:  // fork 失败
            throw system_error(errno, system_category(), "unable to fork " + args[0]);
        case 0:  // 子进程
            // 避免子进程被终止，要求父进程处理中断信号
            signal(SIGINT, SIG_IGN);
            for (auto &[key, value] : env)
                setenv(key.c_str(), value.c_str(), 1);
            execvp(argv[0], argv.data());
            _exit(EXIT_FAILURE);
        default:  // 父进程
            int status;
            while (waitpid(pid, &status, 0) == -1) {
                if (errno != EINTR)
                    throw system_error(errno, system_category(), "unable to wait for " + args[0]);
            }
            if (WIFEXITED(status))
                return WEXITSTATUS(status);
            else
                return -1;
    }
}

string trim(const string &str) {
    return boost::algorithm::trim_copy(str);
}

bool is_blank(const string &str) {
    return boost::algorithm::trim_copy(str).empty();
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

long long elapsed_time::milliseconds() const {
    return duration<chrono::milliseconds>().count();
}

}  // namespace executor
