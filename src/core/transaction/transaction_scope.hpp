#pragma once

#include "common/status.hpp"
#include "core/transaction/transaction_manager.hpp"

#include <functional>
#include <optional>

namespace txbind {
namespace core {

// 事务作用域, RAII 管理事务的开始和结束
// 析构时若未完成则回滚, 失败只记录日志
class TransactionScope {
public:
    TransactionScope(ResourceTransactionManager& manager, TransactionContext& context,
                     TransactionDefinition definition = TransactionDefinition());
    ~TransactionScope();

    TransactionScope(const TransactionScope&) = delete;
    TransactionScope& operator=(const TransactionScope&) = delete;

    common::Status Begin(); // 开始事务
    common::Status Commit(); // 提交事务
    common::Status Rollback(); // 回滚事务

    // 标记仅回滚, Commit 将转为回滚
    void SetRollbackOnly();

    bool IsActive() const noexcept { return status_.has_value() && !status_->IsCompleted(); }
    TransactionStatus* GetTransactionStatus() noexcept { return status_ ? &*status_ : nullptr; }

    // 当前资源, 未开始或空事务时为空
    TransactionalResource* Resource() const noexcept;

private:
    ResourceTransactionManager& manager_;
    TransactionContext& context_;
    TransactionDefinition definition_;
    std::optional<TransactionStatus> status_;
};

using TransactionCallback = std::function<common::Status(TransactionStatus&)>;

// 在事务中执行回调: 返回 OK 则提交, 否则回滚
// 回滚失败作为次要错误附加在回调错误上
common::Status ExecuteInTransaction(ResourceTransactionManager& manager,
                                    TransactionContext& context,
                                    const TransactionDefinition& definition,
                                    const TransactionCallback& callback);

}
}
