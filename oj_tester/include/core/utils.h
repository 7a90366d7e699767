/**
 * @file utils.h
 * @brief 工具函数
 *
 * 包含各种辅助函数：
 * - 文件读取（UTF-8，失败时退回 Latin-1）
 * - 行切分与空白处理
 * - 字符串转义显示
 */

#ifndef OJT_CORE_UTILS_H
#define OJT_CORE_UTILS_H

#include <string>
#include <vector>
#include <sstream>
#include <fstream>
#include <iomanip>
#include <cstdio>
#include <cstring>
#include <cstdlib>
#include <climits>
#include <cstdint>
#include <cerrno>
#include "core/error.h"

namespace ojt {

//==============================================================================
// 编码处理
//==============================================================================

/**
 * @brief 检查字节串是否为合法 UTF-8
 */
inline bool is_valid_utf8(const std::string &s) {
    size_t i = 0;
    const size_t n = s.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        size_t len;
        uint32_t cp;
        if (c < 0x80) {
            i++;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2; cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3; cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4; cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > n) {
            return false;
        }
        for (size_t k = 1; k < len; k++) {
            unsigned char cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        // 过长编码、代理区、超出范围
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
            (len == 4 && (cp < 0x10000 || cp > 0x10FFFF)) ||
            (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += len;
    }
    return true;
}

/**
 * @brief 把 Latin-1 字节串转成 UTF-8
 */
inline std::string latin1_to_utf8(const std::string &s) {
    std::string r;
    r.reserve(s.size() * 2);
    for (unsigned char c : s) {
        if (c < 0x80) {
            r += static_cast<char>(c);
        } else {
            r += static_cast<char>(0xC0 | (c >> 6));
            r += static_cast<char>(0x80 | (c & 0x3F));
        }
    }
    return r;
}

/**
 * @brief 解码文本：合法 UTF-8 原样返回，否则按 Latin-1 解读
 */
inline std::string decode_text(std::string bytes) {
    if (is_valid_utf8(bytes)) {
        return bytes;
    }
    return latin1_to_utf8(bytes);
}

//==============================================================================
// 文件操作
//==============================================================================

/**
 * @brief 获取真实路径
 * @return 规范化的绝对路径，失败返回空字符串
 */
inline std::string get_realpath(const std::string &path) {
    char real[PATH_MAX + 1];
    if (realpath(path.c_str(), real) == NULL) {
        return "";
    }
    return real;
}

/**
 * @brief 读取整个文本文件
 */
inline Result<std::string> read_text_file(const std::string &path) {
    std::ifstream fin(path, std::ios::in | std::ios::binary);
    if (!fin) {
        return Err<std::string>(ErrorCode::FILE_READ_ERROR,
            "Cannot open " + path + ": " + strerror(errno));
    }
    std::ostringstream buf;
    buf << fin.rdbuf();
    if (fin.bad()) {
        return Err<std::string>(ErrorCode::FILE_READ_ERROR, "Failed to read " + path);
    }
    return decode_text(buf.str());
}

//==============================================================================
// 字符串处理
//==============================================================================

inline bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

/**
 * @brief 去掉首尾空白
 */
inline std::string trim(const std::string &s) {
    size_t b = 0, e = s.size();
    while (b < e && is_space(s[b])) b++;
    while (e > b && is_space(s[e - 1])) e--;
    return s.substr(b, e - b);
}

/**
 * @brief 行结束符的长度，不是行结束符时返回 0
 *
 * 单字节：\n \r \v \f \x1c \x1d \x1e，以及 \r\n；
 * UTF-8：U+0085 (C2 85)、U+2028 (E2 80 A8)、U+2029 (E2 80 A9)。
 */
inline size_t line_break_length(const std::string &text, size_t i) {
    unsigned char c = static_cast<unsigned char>(text[i]);
    switch (c) {
        case '\r':
            return (i + 1 < text.size() && text[i + 1] == '\n') ? 2 : 1;
        case '\n': case '\v': case '\f': case 0x1c: case 0x1d: case 0x1e:
            return 1;
        case 0xC2:
            return (i + 1 < text.size() && static_cast<unsigned char>(text[i + 1]) == 0x85) ? 2 : 0;
        case 0xE2:
            if (i + 2 < text.size() && static_cast<unsigned char>(text[i + 1]) == 0x80) {
                unsigned char t = static_cast<unsigned char>(text[i + 2]);
                return (t == 0xA8 || t == 0xA9) ? 3 : 0;
            }
            return 0;
        default:
            return 0;
    }
}

/**
 * @brief 按行切分
 *
 * 行结束符见 line_break_length；结尾的行结束符不会产生额外空行。
 */
inline std::vector<std::string> split_lines(const std::string &text) {
    std::vector<std::string> lines;
    std::string cur;
    for (size_t i = 0; i < text.size(); ) {
        size_t brk = line_break_length(text, i);
        if (brk > 0) {
            lines.push_back(cur);
            cur.clear();
            i += brk;
        } else {
            cur += text[i++];
        }
    }
    if (!cur.empty()) {
        lines.push_back(cur);
    }
    return lines;
}

inline std::string join(const std::vector<std::string> &parts, const std::string &sep) {
    std::string r;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) r += sep;
        r += parts[i];
    }
    return r;
}

/**
 * @brief 检查是否全部由十进制数字组成（空串返回 false）
 */
inline bool is_all_digits(const std::string &s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

/**
 * @brief 带引号的转义显示，用于 diff 报告
 *
 * 默认使用单引号；内容含 ' 而不含 " 时改用双引号。
 */
inline std::string quote_repr(const std::string &s) {
    char quote = '\'';
    if (s.find('\'') != std::string::npos && s.find('"') == std::string::npos) {
        quote = '"';
    }
    std::ostringstream oss;
    oss << quote;
    for (unsigned char c : s) {
        switch (c) {
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c == static_cast<unsigned char>(quote)) {
                    oss << '\\' << quote;
                } else if (c < 0x20 || c == 0x7F) {
                    oss << "\\x" << std::hex << std::setw(2) << std::setfill('0')
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << static_cast<char>(c);
                }
        }
    }
    oss << quote;
    return oss.str();
}

/**
 * @brief 毫秒数格式化，保留两位小数
 */
inline std::string format_ms(double ms) {
    char buf[64];
    snprintf(buf, sizeof(buf), "%.2f", ms);
    return buf;
}

} // namespace ojt

#endif // OJT_CORE_UTILS_H
