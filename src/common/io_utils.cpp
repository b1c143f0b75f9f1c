#include "common/io_utils.hpp"
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace executor {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path.string(), ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    if (path.has_parent_path())
        fs::create_directories(path.parent_path());
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open " + path.string());
    fout << content;
    fout.close();
    if (!fout)
        throw system_error(errno, system_category(), "unable to write " + path.string());
}

// 返回 s[i] 开始的合法 UTF-8 字符的字节数，不合法时返回 0
static size_t utf8_sequence_length(const string &s, size_t i) {
    unsigned char c = s[i];
    size_t n;
    if (c <= 0x7f)
        return 1;  // 0bbbbbbb
    else if ((c & 0xE0) == 0xC0 && c >= 0xC2)
        n = 1;  // 110bbbbb
    else if ((c & 0xF0) == 0xE0)
        n = 2;  // 1110bbbb
    else if ((c & 0xF8) == 0xF0 && c <= 0xF4)
        n = 3;  // 11110bbb
    else
        return 0;

    if (i + n >= s.size()) return 0;  // 截断的字符
    for (size_t j = 1; j <= n; ++j)
        if (((unsigned char)s[i + j] & 0xC0) != 0x80)
            return 0;

    unsigned char c1 = s[i + 1];
    if (c == 0xE0 && c1 < 0xA0) return 0;  // overlong
    if (c == 0xED && c1 >= 0xA0) return 0;  // U+D800 to U+DFFF
    if (c == 0xF0 && c1 < 0x90) return 0;  // overlong
    if (c == 0xF4 && c1 >= 0x90) return 0;  // > U+10FFFF
    return n + 1;
}

string utf8_sanitize(const string &bytes) {
    static const char *replacement = "\xEF\xBF\xBD";
    string result;
    result.reserve(bytes.size());
    for (size_t i = 0; i < bytes.size();) {
        size_t len = utf8_sequence_length(bytes, i);
        if (len == 0) {
            result += replacement;
            ++i;
        } else {
            result.append(bytes, i, len);
            i += len;
        }
    }
    return result;
}

string assert_safe_path(const string &subpath) {
    fs::path p(subpath);
    if (subpath.empty() || p.is_absolute())
        throw invalid_argument("subpath is not safe " + subpath);
    for (auto &part : p)
        if (part == "..")
            throw invalid_argument("subpath is not safe " + subpath);
    return subpath;
}

}  // namespace executor
