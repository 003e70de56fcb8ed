#pragma once

namespace txbind {
namespace core {

enum class CompletionStatus {
    kCommitted,
    kRolledBack,
    kUnknown,   // 提交失败且未回滚, 结果不确定
};

inline const char* CompletionStatusToString(CompletionStatus status) {
    switch (status) {
        case CompletionStatus::kCommitted:
            return "COMMITTED";
        case CompletionStatus::kRolledBack:
            return "ROLLED_BACK";
        case CompletionStatus::kUnknown:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

// 事务完成回调, 默认实现为空
class TransactionSynchronization {
public:
    virtual ~TransactionSynchronization() = default;

    virtual void BeforeCommit(bool /*read_only*/) {}
    virtual void BeforeCompletion() {}
    virtual void AfterCompletion(CompletionStatus /*status*/) {}
};

}
}
