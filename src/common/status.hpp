#pragma once

#include <string>
#include <utility>

namespace vault {
namespace common {

// 定义状态码枚举, 与 gRPC 状态码保持一致
enum class StatusCode {
    kOk = 0,
    kInvalidArgument = 3,
    kNotFound = 5,
    kAlreadyExists = 6,
    kFailedPrecondition = 9,
    kAborted = 10,
    kUnauthenticated = 16,
    kInternal = 13,
    kUnavailable = 14,
    kDataLoss = 15,
};

// 表示操作结果的状态
class Status {
public:
    Status() = default;
    Status(StatusCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    static Status OK() {
        return Status(StatusCode::kOk, "");
    }
    static Status InvalidArgument(std::string message) {
        return Status(StatusCode::kInvalidArgument, std::move(message));
    }
    static Status NotFound(std::string message) {
        return Status(StatusCode::kNotFound, std::move(message));
    }
    static Status AlreadyExists(std::string message) {
        return Status(StatusCode::kAlreadyExists, std::move(message));
    }
    // 调用顺序错误 (例如事务状态非法), 不应重试
    static Status FailedPrecondition(std::string message) {
        return Status(StatusCode::kFailedPrecondition, std::move(message));
    }
    static Status Aborted(std::string message) {
        return Status(StatusCode::kAborted, std::move(message));
    }
    static Status Unauthenticated(std::string message) {
        return Status(StatusCode::kUnauthenticated, std::move(message));
    }
    static Status Internal(std::string message) {
        return Status(StatusCode::kInternal, std::move(message));
    }
    static Status Unavailable(std::string message) {
        return Status(StatusCode::kUnavailable, std::move(message));
    }
    // 两个存储层的数据不一致
    static Status DataLoss(std::string message) {
        return Status(StatusCode::kDataLoss, std::move(message));
    }

    bool IsOk() const {
        return code_ == StatusCode::kOk;
    }
    StatusCode Code() const {
        return code_;
    }
    const std::string& Message() const {
        return message_;
    }
private:
    StatusCode code_ = StatusCode::kOk;
    std::string message_;
};

inline std::string StatusCodeToString(StatusCode code) {
    switch (code) {
        case StatusCode::kOk:
            return "OK";
        case StatusCode::kInvalidArgument:
            return "Invalid Argument";
        case StatusCode::kNotFound:
            return "Not Found";
        case StatusCode::kAlreadyExists:
            return "Already Exists";
        case StatusCode::kFailedPrecondition:
            return "Failed Precondition";
        case StatusCode::kAborted:
            return "Aborted";
        case StatusCode::kUnauthenticated:
            return "Unauthenticated";
        case StatusCode::kInternal:
            return "Internal";
        case StatusCode::kUnavailable:
            return "Unavailable";
        case StatusCode::kDataLoss:
            return "Data Loss";
        default:
            return "Unknown";
    }
}

}
}
