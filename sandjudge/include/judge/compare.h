/**
 * @file compare.h
 * @brief 输出比较
 */

#ifndef SJ_JUDGE_COMPARE_H
#define SJ_JUDGE_COMPARE_H

#include <string>
#include <vector>
#include <sstream>

#include "core/types.h"

namespace sj {
namespace judge {

namespace detail {

inline bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

inline std::vector<std::string> split_lines(const std::string &s) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t nl = s.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(s.substr(start));
            break;
        }
        lines.push_back(s.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

} // namespace detail

/**
 * @brief 按比较模式规范化输出
 *
 * 顺序：去首尾空白 -> 去每行行尾空格/制表符 -> 可选删除空行
 */
inline std::string normalize_output(const std::string &output, const ComparisonMode &mode) {
    std::string s = output;

    if (mode.trim_whitespace) {
        size_t b = 0, e = s.size();
        while (b < e && detail::is_space(s[b])) b++;
        while (e > b && detail::is_space(s[e - 1])) e--;
        s = s.substr(b, e - b);
    }

    if (mode.ignore_trailing_spaces || mode.ignore_empty_lines) {
        std::vector<std::string> lines = detail::split_lines(s);
        std::string out;
        bool first = true;
        for (auto &line : lines) {
            if (mode.ignore_trailing_spaces) {
                size_t e = line.size();
                while (e > 0 && (line[e - 1] == ' ' || line[e - 1] == '\t' || line[e - 1] == '\r')) e--;
                line.resize(e);
            }
            if (mode.ignore_empty_lines) {
                bool blank = true;
                for (char c : line) {
                    if (!detail::is_space(c)) { blank = false; break; }
                }
                if (blank) continue;
            }
            if (!first) out += '\n';
            out += line;
            first = false;
        }
        s = out;
    }
    return s;
}

/**
 * @brief 两侧用同样的规则规范化后比较
 */
inline bool compare_output(const std::string &actual, const std::string &expected,
                           const ComparisonMode &mode) {
    return normalize_output(actual, mode) == normalize_output(expected, mode);
}

} // namespace judge
} // namespace sj

#endif // SJ_JUDGE_COMPARE_H
