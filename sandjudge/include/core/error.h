/**
 * @file error.h
 * @brief 错误码、Error 与 Result<T>
 *
 * 基础设施失败（找不到文件、配置非法、fork 失败、队列已关闭……）都以
 * Error 返回，沿调用链用 SJ_TRY 系列宏向上传递，逐层可附加上下文。
 *
 * 资源超限、违规系统调用、答案错误等属于运行结果，由 RawResult 和
 * VerdictKind 表示，不走这里。
 */

#ifndef SJ_CORE_ERROR_H
#define SJ_CORE_ERROR_H

#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <stdexcept>
#include <sstream>
#include <ostream>

namespace sj {

//==============================================================================
// 错误码
//==============================================================================

/*
 * 按百位分组：
 *   1xx 文件   2xx 配置   3xx 编译/语言   4xx 运行   5xx 评测
 *   6xx 提交与状态      7xx 沙箱         9xx 系统
 */
#define SJ_ERROR_CODE_LIST(X)          \
    X(OK, 0)                           \
    X(FILE_NOT_FOUND, 100)             \
    X(FILE_READ_ERROR, 101)            \
    X(FILE_WRITE_ERROR, 102)           \
    X(CONFIG_PARSE_ERROR, 200)         \
    X(CONFIG_MISSING_KEY, 201)         \
    X(CONFIG_INVALID_VALUE, 202)       \
    X(COMPILE_ERROR, 300)              \
    X(COMPILER_NOT_FOUND, 303)         \
    X(UNSUPPORTED_LANGUAGE, 304)       \
    X(RUNTIME_ERROR, 400)              \
    X(EXEC_FAILED, 401)                \
    X(JUDGE_ERROR, 500)                \
    X(PROBLEM_NOT_FOUND, 501)          \
    X(VALIDATION_ERROR, 600)           \
    X(SUBMISSION_NOT_FOUND, 601)       \
    X(INVALID_STATE, 602)              \
    X(CANCELLED, 603)                  \
    X(QUEUE_CLOSED, 604)               \
    X(PROVISION_FAILED, 700)           \
    X(ISOLATION_UNAVAILABLE, 701)      \
    X(SANDBOX_TERMINATED, 702)         \
    X(SYSTEM_ERROR, 900)               \
    X(FORK_FAILED, 901)                \
    X(PIPE_FAILED, 903)                \
    X(UNKNOWN_ERROR, 999)

enum class ErrorCode {
#define SJ_X_ENUM(name, value) name = value,
    SJ_ERROR_CODE_LIST(SJ_X_ENUM)
#undef SJ_X_ENUM
};

inline const char* error_code_str(ErrorCode code) {
    switch (code) {
#define SJ_X_NAME(name, value) case ErrorCode::name: return #name;
        SJ_ERROR_CODE_LIST(SJ_X_NAME)
#undef SJ_X_NAME
    }
    return "UNKNOWN_ERROR";
}

/// 错误码所在分组的名字，用于日志前缀
inline const char* error_group_str(ErrorCode code) {
    switch (static_cast<int>(code) / 100) {
        case 0: return "ok";
        case 1: return "file";
        case 2: return "config";
        case 3: return "language";
        case 4: return "runtime";
        case 5: return "judge";
        case 6: return "submission";
        case 7: return "sandbox";
        default: return "system";
    }
}

inline std::ostream& operator<<(std::ostream &os, ErrorCode code) {
    return os << error_code_str(code);
}

//==============================================================================
// Error
//==============================================================================

class Error {
private:
    ErrorCode code_ = ErrorCode::OK;
    std::string message_;
    const char *file_ = nullptr;
    int line_ = 0;
    std::vector<std::string> contexts_;   ///< 由内向外追加

public:
    Error() = default;

    Error(ErrorCode code, std::string message = "")
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, const char *file, int line)
        : code_(code), message_(std::move(message)), file_(file), line_(line) {}

    /// 追加一层上下文（文件名、语言 id 之类）
    Error& with_context(const std::string &ctx) {
        contexts_.push_back(ctx);
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    std::string file() const { return file_ ? file_ : ""; }
    int line() const { return line_; }
    const std::vector<std::string>& contexts() const { return contexts_; }

    bool ok() const { return code_ == ErrorCode::OK; }
    explicit operator bool() const { return !ok(); }  // true 表示有错误

    /**
     * @brief 例：[config/CONFIG_MISSING_KEY] compiler (in language rust <- rust.yaml) at language_loader.h:92
     */
    std::string to_string() const {
        std::ostringstream oss;
        oss << "[" << error_group_str(code_) << "/" << error_code_str(code_) << "]";
        if (!message_.empty()) {
            oss << " " << message_;
        }
        if (!contexts_.empty()) {
            oss << " (in ";
            for (size_t i = 0; i < contexts_.size(); i++) {
                oss << (i ? " <- " : "") << contexts_[i];
            }
            oss << ")";
        }
        if (file_ && line_ > 0) {
            std::string path(file_);
            auto slash = path.find_last_of('/');
            oss << " at " << (slash == std::string::npos ? path : path.substr(slash + 1)) << ":" << line_;
        }
        return oss.str();
    }
};

inline std::ostream& operator<<(std::ostream &os, const Error &err) {
    return os << err.to_string();
}

//==============================================================================
// Result<T>
//==============================================================================

/**
 * @brief 值或错误
 *
 *   Result<Problem> p = catalog.find("a-plus-b");
 *   if (p.is_error()) return p.error();
 */
template<typename T>
class Result {
private:
    std::variant<T, Error> data_;

public:
    Result(const T &value) : data_(value) {}
    Result(T &&value) : data_(std::move(value)) {}
    Result(const Error &err) : data_(err) {}
    Result(Error &&err) : data_(std::move(err)) {}
    Result(ErrorCode code, const std::string &msg = "") : data_(Error(code, msg)) {}

    bool ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }
    explicit operator bool() const { return ok(); }

    T& value() & { return std::get<0>(data_); }
    const T& value() const & { return std::get<0>(data_); }
    T&& value() && { return std::get<0>(std::move(data_)); }

    T value_or(T fallback) const {
        return ok() ? std::get<0>(data_) : std::move(fallback);
    }

    Error& error() & { return std::get<1>(data_); }
    const Error& error() const & { return std::get<1>(data_); }

    /// 出错时抛 std::runtime_error；只在测试和启动代码里用
    const T& unwrap() const {
        if (is_error()) {
            throw std::runtime_error(error().to_string());
        }
        return value();
    }
};

template<>
class Result<void> {
private:
    std::optional<Error> error_;

public:
    Result() = default;
    Result(const Error &err) : error_(err) {}
    Result(Error &&err) : error_(std::move(err)) {}
    Result(ErrorCode code, const std::string &msg = "") : error_(Error(code, msg)) {}

    bool ok() const { return !error_; }
    bool is_error() const { return error_.has_value(); }
    explicit operator bool() const { return ok(); }

    Error& error() { return *error_; }
    const Error& error() const { return *error_; }
};

template<typename T>
Result<std::decay_t<T>> Ok(T &&value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
Result<T> Err(ErrorCode code, const std::string &message = "") {
    return Result<T>(Error(code, message));
}

template<typename T = void>
Result<T> Err(const Error &err) {
    return Result<T>(err);
}

//==============================================================================
// 传播宏
//==============================================================================

#define SJ_ERROR(code, msg) \
    sj::Error(code, msg, __FILE__, __LINE__)

#define SJ_TRY(expr) \
    do { \
        auto _sj_r = (expr); \
        if (_sj_r.is_error()) { \
            return _sj_r.error(); \
        } \
    } while (0)

/// 出错时返回；否则把值移进新变量 var
#define SJ_TRY_UNWRAP(var, expr) \
    auto _sj_##var = (expr); \
    if (_sj_##var.is_error()) { \
        return _sj_##var.error(); \
    } \
    auto var = std::move(_sj_##var.value())

/// 同 SJ_TRY_UNWRAP，返回前给错误追加一层上下文
#define SJ_TRY_UNWRAP_CTX(var, expr, ctx) \
    auto _sj_##var = (expr); \
    if (_sj_##var.is_error()) { \
        return sj::Error(_sj_##var.error()).with_context(ctx); \
    } \
    auto var = std::move(_sj_##var.value())

#define SJ_ENSURE(cond, code, msg) \
    do { \
        if (!(cond)) { \
            return SJ_ERROR(code, msg); \
        } \
    } while (0)

} // namespace sj

#endif // SJ_CORE_ERROR_H
