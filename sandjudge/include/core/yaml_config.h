/**
 * @file yaml_config.h
 * @brief 配置文件用的 YAML 子集
 *
 * 支持：
 * - 缩进表示的 map 和 list，list 项可以是 map（`- id: x` 后续键对齐）
 * - 流式 `[a, "b, c"]` 和 `{k: v}`（只含标量）
 * - `#` 注释，单双引号字符串（双引号内 \n \t \r \0 \\ \" 转义）
 * - 块字面量 `|` 与 `|-`，用于测试数据的多行输入输出
 *
 * 缩进只能用空格。不支持锚点、多文档、折叠块 `>`。
 */

#ifndef SJ_CORE_YAML_CONFIG_H
#define SJ_CORE_YAML_CONFIG_H

#include <string>
#include <vector>
#include <map>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <variant>
#include <memory>
#include <optional>
#include <cstdlib>
#include <cerrno>
#include <cctype>

#include "error.h"

namespace sj {
namespace yaml {

class YamlNode;
using YamlNodePtr = std::shared_ptr<YamlNode>;
using YamlMap = std::map<std::string, YamlNodePtr>;
using YamlList = std::vector<YamlNodePtr>;

namespace detail {

inline std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

template<typename T, typename Conv>
bool parse_number(const std::string &s, T &out, Conv conv) {
    if (s.empty()) {
        return false;
    }
    errno = 0;
    char *end = nullptr;
    T v = conv(s.c_str(), &end);
    if (errno != 0 || end != s.c_str() + s.size()) {
        return false;
    }
    out = v;
    return true;
}

inline bool parse_int64(const std::string &s, int64_t &out) {
    return parse_number(s, out, [](const char *p, char **e) { return static_cast<int64_t>(std::strtoll(p, e, 10)); });
}

inline bool parse_double(const std::string &s, double &out) {
    return parse_number(s, out, [](const char *p, char **e) { return std::strtod(p, e); });
}

/// 0 / 1 / -1（无法识别）
inline int parse_truth(const std::string &s) {
    std::string l = lower(s);
    if (l == "true" || l == "yes" || l == "on") return 1;
    if (l == "false" || l == "no" || l == "off") return 0;
    return -1;
}

} // namespace detail

//==============================================================================
// 节点
//==============================================================================

class YamlNode {
private:
    std::variant<std::monostate, std::string, int64_t, double, bool, YamlMap, YamlList> value_;

    template<typename T>
    const T* peek() const { return std::get_if<T>(&value_); }

public:
    YamlNode() = default;
    explicit YamlNode(std::string s) : value_(std::move(s)) {}
    explicit YamlNode(int64_t i) : value_(i) {}
    explicit YamlNode(double d) : value_(d) {}
    explicit YamlNode(bool b) : value_(b) {}
    explicit YamlNode(YamlMap m) : value_(std::move(m)) {}
    explicit YamlNode(YamlList l) : value_(std::move(l)) {}

    bool is_null() const { return peek<std::monostate>() != nullptr; }
    bool is_string() const { return peek<std::string>() != nullptr; }
    bool is_int() const { return peek<int64_t>() != nullptr; }
    bool is_double() const { return peek<double>() != nullptr; }
    bool is_bool() const { return peek<bool>() != nullptr; }
    bool is_map() const { return peek<YamlMap>() != nullptr; }
    bool is_list() const { return peek<YamlList>() != nullptr; }
    bool is_number() const { return is_int() || is_double(); }

    /// 标量转字符串；map / list / null 返回 def
    std::string as_string(const std::string &def = "") const {
        if (auto s = peek<std::string>()) return *s;
        if (auto i = peek<int64_t>()) return std::to_string(*i);
        if (auto b = peek<bool>()) return *b ? "true" : "false";
        if (auto d = peek<double>()) {
            std::ostringstream oss;
            oss << *d;
            return oss.str();
        }
        return def;
    }

    int64_t as_int(int64_t def = 0) const {
        if (auto i = peek<int64_t>()) return *i;
        if (auto d = peek<double>()) return static_cast<int64_t>(*d);
        int64_t v;
        if (auto s = peek<std::string>()) return detail::parse_int64(*s, v) ? v : def;
        return def;
    }

    double as_double(double def = 0.0) const {
        if (auto d = peek<double>()) return *d;
        if (auto i = peek<int64_t>()) return static_cast<double>(*i);
        double v;
        if (auto s = peek<std::string>()) return detail::parse_double(*s, v) ? v : def;
        return def;
    }

    bool as_bool(bool def = false) const {
        if (auto b = peek<bool>()) return *b;
        if (auto i = peek<int64_t>()) return *i != 0;
        if (auto s = peek<std::string>()) {
            int t = detail::parse_truth(*s);
            return t < 0 ? def : t == 1;
        }
        return def;
    }

    const YamlMap& as_map() const {
        static const YamlMap none;
        auto m = peek<YamlMap>();
        return m ? *m : none;
    }

    const YamlList& as_list() const {
        static const YamlList none;
        auto l = peek<YamlList>();
        return l ? *l : none;
    }

    /// 单个标量也当作只有一项的列表
    std::vector<std::string> as_string_list() const {
        std::vector<std::string> out;
        if (is_string()) {
            out.push_back(as_string());
        }
        for (const auto &item : as_list()) {
            out.push_back(item->as_string());
        }
        return out;
    }

    YamlNodePtr get(const std::string &key) const {
        const YamlMap &m = as_map();
        auto it = m.find(key);
        return it == m.end() ? nullptr : it->second;
    }

    YamlNodePtr get(size_t index) const {
        const YamlList &l = as_list();
        return index < l.size() ? l[index] : nullptr;
    }

    bool has(const std::string &key) const { return get(key) != nullptr; }

    /// 点分路径，如 "pool.backoff_factor"
    YamlNodePtr operator[](const std::string &path) const {
        size_t dot = path.find('.');
        YamlNodePtr head = get(path.substr(0, dot));
        if (dot == std::string::npos || !head) {
            return head;
        }
        return (*head)[path.substr(dot + 1)];
    }

    std::string str_at(const std::string &path, const std::string &def = "") const {
        auto n = (*this)[path];
        return n ? n->as_string(def) : def;
    }

    int64_t int_at(const std::string &path, int64_t def = 0) const {
        auto n = (*this)[path];
        return n ? n->as_int(def) : def;
    }

    double double_at(const std::string &path, double def = 0.0) const {
        auto n = (*this)[path];
        return n ? n->as_double(def) : def;
    }

    bool bool_at(const std::string &path, bool def = false) const {
        auto n = (*this)[path];
        return n ? n->as_bool(def) : def;
    }
};

//==============================================================================
// 解析器
//==============================================================================

class YamlParser {
private:
    std::vector<std::string> lines_;
    size_t pos_ = 0;
    std::optional<Error> error_;

    static std::string trim(const std::string &s) {
        size_t b = s.find_first_not_of(" \t\r\n");
        if (b == std::string::npos) {
            return "";
        }
        return s.substr(b, s.find_last_not_of(" \t\r\n") - b + 1);
    }

    static size_t indent_of(const std::string &line) {
        size_t n = 0;
        while (n < line.size() && line[n] == ' ') {
            n++;
        }
        return n;
    }

    /**
     * @brief 扫描引号之外的字符
     *
     * 回调返回 true 时停止，返回停止处的下标；没停下返回 npos。
     */
    template<typename Fn>
    static size_t scan_unquoted(const std::string &s, Fn &&stop_at) {
        char quote = 0;
        for (size_t i = 0; i < s.size(); i++) {
            char c = s[i];
            if (quote) {
                if (quote == '"' && c == '\\') {
                    i++;
                } else if (c == quote) {
                    quote = 0;
                }
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (stop_at(s, i)) {
                return i;
            }
        }
        return std::string::npos;
    }

    static std::string strip_comment(const std::string &line) {
        size_t hash = scan_unquoted(line, [](const std::string &s, size_t i) {
            return s[i] == '#' && (i == 0 || s[i - 1] == ' ' || s[i - 1] == '\t');
        });
        return hash == std::string::npos ? line : line.substr(0, hash);
    }

    /// `key: value` 的冒号：冒号后须是空白或行尾
    static size_t key_colon(const std::string &s) {
        return scan_unquoted(s, [](const std::string &t, size_t i) {
            return t[i] == ':' && (i + 1 == t.size() || t[i + 1] == ' ' || t[i + 1] == '\t');
        });
    }

    static bool quoted(const std::string &s) {
        return s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front();
    }

    static std::string unquote(const std::string &s) {
        if (!quoted(s)) {
            return s;
        }
        std::string inner = s.substr(1, s.size() - 2);
        if (s.front() == '\'') {
            return inner;
        }
        std::string out;
        for (size_t i = 0; i < inner.size(); i++) {
            if (inner[i] != '\\' || i + 1 == inner.size()) {
                out += inner[i];
                continue;
            }
            char c = inner[++i];
            switch (c) {
                case 'n': out += '\n'; break;
                case 't': out += '\t'; break;
                case 'r': out += '\r'; break;
                case '0': out += '\0'; break;
                case '"':
                case '\\': out += c; break;
                default: out += '\\'; out += c; break;
            }
        }
        return out;
    }

    /// 按引号外的逗号切分
    static std::vector<std::string> split_flow(const std::string &body) {
        std::vector<std::string> parts;
        std::string rest = body;
        while (true) {
            size_t comma = scan_unquoted(rest, [](const std::string &s, size_t i) { return s[i] == ','; });
            parts.push_back(trim(rest.substr(0, comma)));
            if (comma == std::string::npos) {
                break;
            }
            rest = rest.substr(comma + 1);
        }
        if (parts.size() == 1 && parts[0].empty()) {
            parts.clear();
        }
        return parts;
    }

    static YamlNodePtr scalar(const std::string &text) {
        std::string v = trim(text);
        if (v.empty() || v == "~" || v == "null") {
            return std::make_shared<YamlNode>();
        }
        if (quoted(v)) {
            return std::make_shared<YamlNode>(unquote(v));
        }
        std::string l = detail::lower(v);
        if (l == "true" || l == "yes") return std::make_shared<YamlNode>(true);
        if (l == "false" || l == "no") return std::make_shared<YamlNode>(false);
        int64_t i;
        if (detail::parse_int64(v, i)) {
            return std::make_shared<YamlNode>(i);
        }
        double d;
        if (v.find_first_of(".eE") != std::string::npos && detail::parse_double(v, d)) {
            return std::make_shared<YamlNode>(d);
        }
        return std::make_shared<YamlNode>(v);
    }

    static YamlNodePtr inline_value(const std::string &text) {
        std::string v = trim(text);
        if (v.size() >= 2 && v.front() == '[' && v.back() == ']') {
            YamlList list;
            for (const auto &item : split_flow(v.substr(1, v.size() - 2))) {
                list.push_back(scalar(item));
            }
            return std::make_shared<YamlNode>(std::move(list));
        }
        if (v.size() >= 2 && v.front() == '{' && v.back() == '}') {
            YamlMap map;
            for (const auto &pair : split_flow(v.substr(1, v.size() - 2))) {
                size_t colon = key_colon(pair);
                if (colon == std::string::npos) {
                    colon = pair.find(':');
                }
                if (colon != std::string::npos) {
                    map[unquote(trim(pair.substr(0, colon)))] = scalar(pair.substr(colon + 1));
                }
            }
            return std::make_shared<YamlNode>(std::move(map));
        }
        return scalar(v);
    }

    void fail(const std::string &message) {
        if (!error_) {
            error_ = Error(ErrorCode::CONFIG_PARSE_ERROR, "line " + std::to_string(pos_ + 1) + ": " + message);
        }
    }

    /// 跳过空行和纯注释行，返回下一条有效行的缩进；没有了返回 npos
    size_t peek_indent() {
        while (pos_ < lines_.size()) {
            std::string t = trim(strip_comment(lines_[pos_]));
            if (!t.empty()) {
                return indent_of(lines_[pos_]);
            }
            pos_++;
        }
        return std::string::npos;
    }

    YamlNodePtr literal_block(size_t owner_indent, bool chomp) {
        std::vector<std::string> body;
        size_t col = std::string::npos;
        for (; pos_ < lines_.size(); pos_++) {
            const std::string &raw = lines_[pos_];
            if (trim(raw).empty()) {
                body.emplace_back();
                continue;
            }
            size_t ind = indent_of(raw);
            if (ind <= owner_indent || (col != std::string::npos && ind < col)) {
                break;
            }
            if (col == std::string::npos) {
                col = ind;
            }
            body.push_back(raw.substr(col));
        }
        while (!body.empty() && body.back().empty()) {
            body.pop_back();
        }
        std::string text;
        for (size_t i = 0; i < body.size(); i++) {
            text += (i ? "\n" : "") + body[i];
        }
        if (!chomp && !body.empty()) {
            text += '\n';
        }
        return std::make_shared<YamlNode>(std::move(text));
    }

    /// 冒号或 `-` 之后的部分：行内值、块字面量，或者下一行开始的嵌套块
    YamlNodePtr value_after(const std::string &rest, size_t owner_indent) {
        if (rest == "|" || rest == "|-") {
            return literal_block(owner_indent, rest == "|-");
        }
        if (!rest.empty()) {
            return inline_value(rest);
        }
        size_t next = peek_indent();
        if (next == std::string::npos || next <= owner_indent) {
            return std::make_shared<YamlNode>();
        }
        return block(next);
    }

    YamlNodePtr sequence(size_t indent) {
        YamlList list;
        while (peek_indent() == indent) {
            std::string line = strip_comment(lines_[pos_]);
            std::string body = trim(line);
            if (body[0] != '-' || (body.size() > 1 && body[1] != ' ')) {
                break;
            }
            std::string rest = trim(body.substr(1));
            if (rest.empty() || rest == "|" || rest == "|-" || quoted(rest) || key_colon(rest) == std::string::npos) {
                pos_++;
                list.push_back(value_after(rest, indent));
                continue;
            }
            // `- key: v`：把 "- " 换成空格，当成从 key 列开始的 map
            size_t col = line.find('-') + 1;
            while (col < line.size() && line[col] == ' ') {
                col++;
            }
            lines_[pos_] = std::string(col, ' ') + line.substr(col);
            list.push_back(mapping(col));
        }
        return std::make_shared<YamlNode>(std::move(list));
    }

    YamlNodePtr mapping(size_t indent) {
        YamlMap map;
        while (peek_indent() == indent) {
            std::string body = trim(strip_comment(lines_[pos_]));
            if (body[0] == '-' && (body.size() == 1 || body[1] == ' ')) {
                break;
            }
            size_t colon = key_colon(body);
            if (colon == std::string::npos) {
                fail("expected 'key: value', got '" + body + "'");
                pos_++;
                continue;
            }
            std::string key = unquote(trim(body.substr(0, colon)));
            pos_++;
            map[key] = value_after(trim(body.substr(colon + 1)), indent);
        }
        return std::make_shared<YamlNode>(std::move(map));
    }

    YamlNodePtr block(size_t indent) {
        std::string body = trim(strip_comment(lines_[pos_]));
        bool dash = body[0] == '-' && (body.size() == 1 || body[1] == ' ');
        YamlNodePtr node = dash ? sequence(indent) : mapping(indent);
        size_t next = peek_indent();
        if (next != std::string::npos && next > indent) {
            fail("unexpected indentation");
            pos_ = lines_.size();
        }
        return node;
    }

public:
    /**
     * @brief 解析文本；空文档得到空 map
     */
    Result<YamlNodePtr> parse(const std::string &content) {
        lines_.clear();
        pos_ = 0;
        error_.reset();

        std::istringstream in(content);
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            size_t ind = indent_of(line);
            if (ind < line.size() && line[ind] == '\t' && !trim(line).empty()) {
                error_ = Error(ErrorCode::CONFIG_PARSE_ERROR,
                               "line " + std::to_string(lines_.size() + 1) + ": tab in indentation");
            }
            lines_.push_back(line);
        }
        if (error_) {
            return *error_;
        }

        YamlNodePtr root;
        size_t first = peek_indent();
        if (first == std::string::npos) {
            root = std::make_shared<YamlNode>(YamlMap{});
        } else {
            root = block(first);
            if (peek_indent() != std::string::npos) {
                fail("content after the top-level block");
            }
        }
        if (error_) {
            return *error_;
        }
        return root;
    }
};

inline Result<YamlNodePtr> load_yaml(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<YamlNodePtr>(ErrorCode::FILE_NOT_FOUND, "Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return Err<YamlNodePtr>(ErrorCode::FILE_READ_ERROR, "Read failed: " + path);
    }
    SJ_TRY_UNWRAP_CTX(root, YamlParser().parse(buffer.str()), path);
    return root;
}

/**
 * @brief 解析内嵌的 YAML 文本，格式错误抛 std::runtime_error
 */
inline YamlNodePtr parse_yaml(const std::string &content) {
    return YamlParser().parse(content).unwrap();
}

} // namespace yaml
} // namespace sj

#endif // SJ_CORE_YAML_CONFIG_H
