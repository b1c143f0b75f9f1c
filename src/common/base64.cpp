#include "common/base64.hpp"
#include <array>

namespace executor {
using namespace std;

static const char b64_chars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789+/";

string base64_encode(const string &data) {
    string out;
    out.reserve((data.size() + 2) / 3 * 4);
    int val = 0, valb = -6;
    for (unsigned char c : data) {
        val = ((val << 8) + c) & 0xFFFFFF;
        valb += 8;
        while (valb >= 0) {
            out.push_back(b64_chars[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }
    if (valb > -6) out.push_back(b64_chars[(val << -valb) & 0x3F]);
    while (out.size() % 4) out.push_back('=');
    return out;
}

string base64_decode(const string &encoded) {
    array<int, 256> table;
    table.fill(-1);
    for (int i = 0; i < 64; i++) table[(unsigned char)b64_chars[i]] = i;

    string out;
    int val = 0, valb = -8;
    for (unsigned char c : encoded) {
        if (table[c] == -1) break;
        val = ((val << 6) + table[c]) & 0xFFFFFF;
        valb += 6;
        if (valb >= 0) {
            out.push_back(char((val >> valb) & 0xFF));
            valb -= 8;
        }
    }
    return out;
}

}  // namespace executor
