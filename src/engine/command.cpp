#include "engine/command.hpp"
#include <stdexcept>
#include "common/base64.hpp"

namespace executor {
using namespace std;

string shell_quote(const string &arg) {
    string result = "'";
    for (char c : arg) {
        if (c == '\'')
            result += "'\\''";
        else
            result.push_back(c);
    }
    result.push_back('\'');
    return result;
}

shell_command &shell_command::in_directory(const string &dir) {
    workdir = dir;
    return *this;
}

shell_command &shell_command::then(const vector<string> &args) {
    if (args.empty())
        throw invalid_argument("shell_command step requires a program");
    steps.push_back({args});
    return *this;
}

shell_command &shell_command::merge_stderr() {
    if (steps.empty())
        throw logic_error("merge_stderr requires a step");
    steps.back().merge_stderr = true;
    return *this;
}

shell_command &shell_command::with_stdin(const string &input) {
    if (steps.empty())
        throw logic_error("with_stdin requires a step");
    steps.back().has_stdin = true;
    steps.back().stdin_base64 = base64_encode(input);
    return *this;
}

shell_command &shell_command::with_stdin_file(const string &path) {
    if (steps.empty())
        throw logic_error("with_stdin_file requires a step");
    steps.back().stdin_file = path;
    return *this;
}

bool shell_command::empty() const {
    return steps.empty();
}

string shell_command::script() const {
    string result;
    if (!workdir.empty())
        result = "cd " + shell_quote(workdir);

    for (auto &s : steps) {
        if (!result.empty()) result += " && ";
        if (s.has_stdin)
            result += "printf '%s' " + shell_quote(s.stdin_base64) + " | base64 -d | ";
        for (size_t i = 0; i < s.args.size(); ++i) {
            if (i) result.push_back(' ');
            result += shell_quote(s.args[i]);
        }
        if (!s.stdin_file.empty())
            result += " < " + shell_quote(s.stdin_file);
        if (s.merge_stderr)
            result += " 2>&1";
    }
    return result;
}

vector<string> shell_command::argv() const {
    return {"/bin/sh", "-c", script()};
}

}  // namespace executor
