#pragma once

#include <string>
#include <utility>
#include <vector>

namespace txbind {
namespace common {

// 定义状态码枚举, 编号与 gRPC 保持一致
enum class StatusCode {
    kOk = 0,
    kInvalidArgument = 3,
    kDeadlineExceeded = 4,
    kNotFound = 5,
    kAlreadyExists = 6,
    kFailedPrecondition = 9,
    kAborted = 10,
    kInternal = 13,
    kUnavailable = 14,
};

inline std::string StatusCodeToString(StatusCode code) {
    switch (code) {
        case StatusCode::kOk:
            return "OK";
        case StatusCode::kInvalidArgument:
            return "Invalid Argument";
        case StatusCode::kDeadlineExceeded:
            return "Deadline Exceeded";
        case StatusCode::kNotFound:
            return "Not Found";
        case StatusCode::kAlreadyExists:
            return "Already Exists";
        case StatusCode::kFailedPrecondition:
            return "Failed Precondition";
        case StatusCode::kAborted:
            return "Aborted";
        case StatusCode::kInternal:
            return "Internal";
        case StatusCode::kUnavailable:
            return "Unavailable";
        default:
            return "Unknown";
    }
}

// 表示操作结果的状态
// 主错误可以附带若干次要错误(例如提交失败后恢复连接设置也失败), 两者都会被保留
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
    static Status DeadlineExceeded(std::string message) {
        return Status(StatusCode::kDeadlineExceeded, std::move(message));
    }
    static Status NotFound(std::string message) {
        return Status(StatusCode::kNotFound, std::move(message));
    }
    static Status AlreadyExists(std::string message) {
        return Status(StatusCode::kAlreadyExists, std::move(message));
    }
    static Status FailedPrecondition(std::string message) {
        return Status(StatusCode::kFailedPrecondition, std::move(message));
    }
    static Status Aborted(std::string message) {
        return Status(StatusCode::kAborted, std::move(message));
    }
    static Status Internal(std::string message) {
        return Status(StatusCode::kInternal, std::move(message));
    }
    static Status Unavailable(std::string message) {
        return Status(StatusCode::kUnavailable, std::move(message));
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

    // 附加次要错误, OK 状态会被忽略
    void AddSuppressed(Status status) {
        if (!status.IsOk()) {
            suppressed_.push_back(std::move(status));
        }
    }
    const std::vector<Status>& Suppressed() const {
        return suppressed_;
    }
    bool HasSuppressed() const {
        return !suppressed_.empty();
    }

    std::string ToString() const {
        if (IsOk()) {
            return "OK";
        }
        std::string text = StatusCodeToString(code_) + ": " + message_;
        for (const auto& secondary : suppressed_) {
            text += " [suppressed ";
            text += secondary.ToString();
            text += "]";
        }
        return text;
    }
private:
    StatusCode code_ = StatusCode::kOk;
    std::string message_;
    std::vector<Status> suppressed_;
};

}
}
