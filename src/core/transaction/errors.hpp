#pragma once

#include "common/status.hpp"

#include <string>

namespace txbind {
namespace core {

enum class TransactionErrorCode {
    kOk = 0,
    kConfiguration = 1,       // 资源不支持请求的隔离级别, 或嵌套事务请求了不同的隔离级别
    kRestoration = 2,         // 完成时恢复隔离级别/自动提交失败
    kProtocolViolation = 3,   // 事务管理器违反了绑定对象的使用约定
    kNoTransaction = 4,       // MANDATORY 传播行为但当前没有事务
    kInvalidTimeout = 5,
    kCannotCreate = 6,        // 无法获取资源
    kCommitFailed = 7,
    kRollbackFailed = 8,
    kTimedOut = 9,            // 提交前已超过截止时间, 已回滚
    kUnexpectedRollback = 10, // 请求提交但事务已被标记为仅回滚
};

inline const char* TransactionErrorName(TransactionErrorCode error) {
    switch (error) {
        case TransactionErrorCode::kOk:
            return "Ok";
        case TransactionErrorCode::kConfiguration:
            return "ConfigurationError";
        case TransactionErrorCode::kRestoration:
            return "RestorationError";
        case TransactionErrorCode::kProtocolViolation:
            return "ProtocolViolation";
        case TransactionErrorCode::kNoTransaction:
            return "NoTransaction";
        case TransactionErrorCode::kInvalidTimeout:
            return "InvalidTimeout";
        case TransactionErrorCode::kCannotCreate:
            return "CannotCreateTransaction";
        case TransactionErrorCode::kCommitFailed:
            return "CommitFailed";
        case TransactionErrorCode::kRollbackFailed:
            return "RollbackFailed";
        case TransactionErrorCode::kTimedOut:
            return "TransactionTimedOut";
        case TransactionErrorCode::kUnexpectedRollback:
            return "UnexpectedRollback";
    }
    return "Unknown";
}

// 将 TransactionErrorCode 转换为通用 Status, 消息以错误种类开头
inline ::txbind::common::Status FromTransactionError(TransactionErrorCode error, const std::string& message = "") {
    using ::txbind::common::Status;
    std::string text = std::string(TransactionErrorName(error)) + (message.empty() ? "" : ": " + message);
    switch (error) {
        case TransactionErrorCode::kOk:
            return Status::OK();
        case TransactionErrorCode::kConfiguration:
        case TransactionErrorCode::kInvalidTimeout:
            return Status::InvalidArgument(std::move(text));
        case TransactionErrorCode::kProtocolViolation:
        case TransactionErrorCode::kNoTransaction:
            return Status::FailedPrecondition(std::move(text));
        case TransactionErrorCode::kCannotCreate:
            return Status::Unavailable(std::move(text));
        case TransactionErrorCode::kTimedOut:
            return Status::DeadlineExceeded(std::move(text));
        case TransactionErrorCode::kUnexpectedRollback:
            return Status::Aborted(std::move(text));
        case TransactionErrorCode::kRestoration:
        case TransactionErrorCode::kCommitFailed:
        case TransactionErrorCode::kRollbackFailed:
            return Status::Internal(std::move(text));
    }
    return Status::Internal("Unknown transaction error");
}

}
}
