#pragma once

#include "core/transaction/resource_holder.hpp"
#include "core/transaction/transaction_binding.hpp"
#include "core/transaction/transaction_definition.hpp"

#include <memory>

namespace txbind {
namespace core {

class ResourceTransactionManager;

// GetTransaction 返回的事务句柄, 交还给 Commit/Rollback
// binding 为空表示 SUPPORTS 传播下的空事务
class TransactionStatus {
public:
    TransactionStatus(std::shared_ptr<TransactionBinding> binding,
                      std::shared_ptr<ResourceHolder> holder,
                      TransactionDefinition definition,
                      bool new_transaction,
                      bool new_synchronization);
    TransactionStatus(TransactionStatus&&) noexcept = default;
    TransactionStatus& operator=(TransactionStatus&&) noexcept = default;
    // 只能完成一次, 禁止拷贝
    TransactionStatus(const TransactionStatus&) = delete;
    TransactionStatus& operator=(const TransactionStatus&) = delete;

    bool HasTransaction() const noexcept { return binding_ != nullptr; }
    bool IsNewTransaction() const noexcept { return binding_ != nullptr && new_transaction_; }
    bool IsNewSynchronization() const noexcept { return new_synchronization_; }

    // 本地仅回滚标记
    void SetRollbackOnly() noexcept { rollback_only_ = true; }
    bool IsRollbackOnly() const noexcept { return rollback_only_; }

    // 包括持有者上由嵌套作用域设置的全局标记
    bool IsGlobalRollbackOnly() const noexcept;

    bool IsCompleted() const noexcept { return completed_; }

    TransactionBinding* Binding() const noexcept { return binding_.get(); }
    ResourceHolder* Holder() const noexcept { return holder_.get(); }
    const TransactionDefinition& Definition() const noexcept { return definition_; }

private:
    friend class ResourceTransactionManager;

    void MarkCompleted() noexcept { completed_ = true; }
    void ReleaseHolder() noexcept { holder_.reset(); }

    std::shared_ptr<TransactionBinding> binding_;
    std::shared_ptr<ResourceHolder> holder_;
    TransactionDefinition definition_;
    bool new_transaction_ = false;
    bool new_synchronization_ = false;
    bool rollback_only_ = false;
    bool completed_ = false;
};

}
}
