#include "common/io_utils.hpp"
#include <fstream>
#include <iterator>
#include <system_error>
#include "common/exceptions.hpp"

namespace engine {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin) throw io_error("unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout) throw io_error("unable to create file " + path.string());
    fout.write(content.data(), content.size());
    fout.close();
    if (!fout) throw io_error("unable to write file " + path.string());
}

bool remove_if_exists(const fs::path &path) {
    error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec) throw io_error("unable to remove " + path.string() + ": " + ec.message());
    return removed;
}

bool utf8_check_is_valid(const string &string) {
    size_t i = 0, ix = string.length();
    while (i < ix) {
        unsigned char c = string[i];
        size_t n;
        // 第一个后继字节的取值范围，用于排除超长编码、代理对和大于 U+10FFFF 的码点
        unsigned char lo = 0x80, hi = 0xBF;
        if (c <= 0x7F) {
            ++i;
            continue;
        } else if (c >= 0xC2 && c <= 0xDF) {
            n = 1;  // 110bbbbb
        } else if (c == 0xE0) {
            n = 2, lo = 0xA0;  // 超长编码
        } else if (c == 0xED) {
            n = 2, hi = 0x9F;  // U+D800 to U+DFFF
        } else if (c >= 0xE1 && c <= 0xEF) {
            n = 2;  // 1110bbbb
        } else if (c == 0xF0) {
            n = 3, lo = 0x90;  // 超长编码
        } else if (c >= 0xF1 && c <= 0xF3) {
            n = 3;  // 11110bbb
        } else if (c == 0xF4) {
            n = 3, hi = 0x8F;  // 不超过 U+10FFFF
        } else {
            return false;  // 后继字节、C0、C1、F5 到 FF
        }
        if (ix - i <= n) return false;
        for (size_t j = 1; j <= n; ++j) {
            unsigned char cc = string[i + j];
            if (j == 1 ? (cc < lo || cc > hi) : (cc & 0xC0) != 0x80)
                return false;
        }
        i += n + 1;
    }
    return true;
}

}  // namespace engine
