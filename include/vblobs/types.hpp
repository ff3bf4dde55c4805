#pragma once

#include <string>
#include <vector>
#include <memory>
#include <cstddef>
#include <cstdint>

namespace vblobs {

// 流拷贝使用的缓冲区大小
const size_t COPY_BUFFER_SIZE = 8192;

// 错误类别
enum class ErrorCode : int {
    None             = 0,
    InvalidPath      = 1,   // 路径越出根目录
    NotFound         = 2,   // 文件或目录不存在
    AlreadyExists    = 3,   // 文件或目录已存在
    InvalidOperation = 4,   // 底层I/O失败
    NoParent         = 5    // 根目录没有父目录
};

std::string ErrorCodeToString(ErrorCode code);

// 错误类型
class Error {
public:
    Error() : code_(ErrorCode::None) {}
    explicit Error(const std::string& message)
        : message_(message), code_(ErrorCode::InvalidOperation) {}
    Error(ErrorCode code, const std::string& message, const std::string& cause = "")
        : message_(message), cause_(cause), code_(code) {}

    const std::string& what() const { return message_; }
    const std::string& cause() const { return cause_; }
    ErrorCode code() const { return code_; }

    bool ok() const { return code_ == ErrorCode::None; }
    bool hasError() const { return code_ != ErrorCode::None; }
    bool is(ErrorCode code) const { return code_ == code; }

    // 包含错误类别和底层原因的完整描述
    std::string describe() const;

private:
    std::string message_;
    std::string cause_;
    ErrorCode code_;
};

// 结果类型
template<typename T>
class Result {
public:
    Result() : error_(ErrorCode::InvalidOperation, "empty result"), hasError_(true) {}
    Result(const T& value) : value_(value), hasError_(false) {}
    Result(T&& value) : value_(std::move(value)), hasError_(false) {}
    Result(const Error& error) : error_(error), hasError_(true) {}

    bool ok() const { return !hasError_; }
    const T& value() const & { return value_; }
    T&& value() && { return std::move(value_); }
    const Error& error() const { return error_; }

private:
    T value_{};
    Error error_;
    bool hasError_;
};

} // namespace vblobs
