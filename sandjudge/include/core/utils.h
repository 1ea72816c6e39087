/**
 * @file utils.h
 * @brief 工具函数
 *
 * 包含各种辅助函数：
 * - 文件操作
 * - 字符串处理
 * - 标识符生成
 */

#ifndef SJ_CORE_UTILS_H
#define SJ_CORE_UTILS_H

#include <string>
#include <vector>
#include <sstream>
#include <fstream>
#include <cstring>
#include <cstdlib>
#include <climits>
#include <cerrno>
#include <cstdint>
#include <mutex>
#include <algorithm>

#include <dirent.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "error.h"

namespace sj {

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

inline bool file_exists(const std::string &path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

inline bool is_executable(const std::string &path) {
    return access(path.c_str(), X_OK) == 0;
}

inline Result<std::string> read_file(const std::string &path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return Err<std::string>(ErrorCode::FILE_NOT_FOUND, "Cannot open file: " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return Err<std::string>(ErrorCode::FILE_READ_ERROR, "Read failed: " + path);
    }
    return ss.str();
}

/**
 * @brief 读取文件前 max_bytes 字节（输出截断用）
 */
inline std::string read_file_prefix(const std::string &path, size_t max_bytes) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return "";
    in.seekg(0, std::ios::end);
    std::streamoff size = in.tellg();
    in.seekg(0, std::ios::beg);
    if (size <= 0) return "";
    size_t n = std::min(max_bytes, static_cast<size_t>(size));
    std::string buf(n, '\0');
    in.read(&buf[0], static_cast<std::streamsize>(n));
    buf.resize(static_cast<size_t>(in.gcount()));
    return buf;
}

inline Result<void> write_file(const std::string &path, const std::string &content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return SJ_ERROR(ErrorCode::FILE_WRITE_ERROR, "Cannot create file: " + path);
    }
    out << content;
    out.flush();
    if (!out.good()) {
        return SJ_ERROR(ErrorCode::FILE_WRITE_ERROR, "Write failed: " + path);
    }
    return Ok();
}

/**
 * @brief 递归创建目录（mkdir -p）
 */
inline Result<void> make_dirs(const std::string &path, mode_t mode = 0755) {
    if (path.empty()) return Ok();
    std::string cur;
    std::stringstream ss(path);
    std::string part;
    if (path[0] == '/') cur = "/";
    while (std::getline(ss, part, '/')) {
        if (part.empty()) continue;
        cur += part;
        if (mkdir(cur.c_str(), mode) != 0 && errno != EEXIST) {
            return SJ_ERROR(ErrorCode::FILE_WRITE_ERROR,
                            "mkdir " + cur + ": " + strerror(errno));
        }
        cur += "/";
    }
    return Ok();
}

/**
 * @brief 递归删除目录，不跟随符号链接
 */
inline bool remove_tree(const std::string &path) {
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) {
        return errno == ENOENT;
    }
    if (!S_ISDIR(st.st_mode)) {
        return unlink(path.c_str()) == 0;
    }
    DIR *dir = opendir(path.c_str());
    if (!dir) return false;
    bool ok = true;
    struct dirent *ent;
    while ((ent = readdir(dir)) != nullptr) {
        if (strcmp(ent->d_name, ".") == 0 || strcmp(ent->d_name, "..") == 0) continue;
        ok = remove_tree(path + "/" + ent->d_name) && ok;
    }
    closedir(dir);
    return rmdir(path.c_str()) == 0 && ok;
}

/**
 * @brief 列出目录中指定后缀的文件（按名字排序）
 */
inline std::vector<std::string> list_files(const std::string &dir, const std::string &suffix) {
    std::vector<std::string> out;
    DIR *d = opendir(dir.c_str());
    if (!d) return out;
    struct dirent *ent;
    while ((ent = readdir(d)) != nullptr) {
        std::string name = ent->d_name;
        if (name.size() > suffix.size() &&
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
            out.push_back(dir + "/" + name);
        }
    }
    closedir(d);
    std::sort(out.begin(), out.end());
    return out;
}

/**
 * @brief 在 PATH 中查找可执行文件，绝对路径原样检查
 */
inline std::string which(const std::string &cmd) {
    if (cmd.empty()) return "";
    if (cmd.find('/') != std::string::npos) {
        return is_executable(cmd) ? cmd : "";
    }
    const char *path_env = getenv("PATH");
    std::string path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
    std::stringstream ss(path);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) continue;
        std::string full = dir + "/" + cmd;
        if (is_executable(full)) return full;
    }
    return "";
}

//==============================================================================
// 字符串处理
//==============================================================================

template <class T>
inline std::string to_string(const T &v) {
    std::ostringstream sout;
    sout << v;
    return sout.str();
}

inline std::string trim(const std::string &s) {
    size_t start = s.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(start, end - start + 1);
}

inline bool is_blank(const std::string &s) {
    return s.find_first_not_of(" \t\r\n\f\v") == std::string::npos;
}

inline std::string replace_all(std::string s, const std::string &from, const std::string &to) {
    if (from.empty()) return s;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

inline std::string join(const std::vector<std::string> &parts, const std::string &sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

/**
 * @brief 检查是否为合法 UTF-8
 */
inline bool is_valid_utf8(const std::string &s) {
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        size_t len;
        if (c < 0x80) len = 1;
        else if ((c >> 5) == 0x6) len = 2;
        else if ((c >> 4) == 0xE) len = 3;
        else if ((c >> 3) == 0x1E) len = 4;
        else return false;
        if (i + len > s.size()) return false;
        for (size_t k = 1; k < len; k++) {
            if ((static_cast<unsigned char>(s[i + k]) >> 6) != 0x2) return false;
        }
        i += len;
    }
    return true;
}

/**
 * @brief 截断字符串并标注
 */
inline std::string truncate(const std::string &s, size_t max_len) {
    if (s.size() <= max_len) return s;
    return s.substr(0, max_len) + "...";
}

/**
 * @brief FNV-1a 哈希，用于判断沙箱内已编译产物是否对应同一份代码
 */
inline uint64_t fnv1a(const std::string &s) {
    uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

//==============================================================================
// 标识符生成
//==============================================================================

/**
 * @brief 生成随机 UUID (v4) 字符串，线程安全
 */
inline std::string generate_uuid() {
    static boost::uuids::random_generator gen;
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    return boost::uuids::to_string(gen());
}

} // namespace sj

#endif // SJ_CORE_UTILS_H
