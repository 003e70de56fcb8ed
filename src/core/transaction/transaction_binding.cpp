#include "core/transaction/transaction_binding.hpp"

#include "core/transaction/errors.hpp"

#include <utility>

namespace txbind {
namespace core {

TransactionBinding TransactionBinding::NewForHolder() {
    return TransactionBinding();
}

TransactionBinding TransactionBinding::NewForExistingHolder(ResourceHolder* holder) {
    TransactionBinding binding;
    binding.holder_ = holder;
    binding.participating_ = true;
    return binding;
}

common::Status TransactionBinding::SetHolder(ResourceHolder* holder) {
    if (holder == nullptr) {
        return FromTransactionError(TransactionErrorCode::kProtocolViolation, "holder must not be null");
    }
    holder_ = holder;
    return common::Status::OK();
}

common::Status TransactionBinding::SetPreviousIsolationLevel(std::optional<int> level) {
    if (restoration_consumed_) {
        return FromTransactionError(TransactionErrorCode::kProtocolViolation,
                                    "previous isolation level written after restoration");
    }
    if (isolation_recorded_) {
        return FromTransactionError(TransactionErrorCode::kProtocolViolation,
                                    "previous isolation level already recorded");
    }
    // 参与事务不拥有隔离级别的恢复责任
    if (participating_ && level.has_value()) {
        return FromTransactionError(TransactionErrorCode::kProtocolViolation,
                                    "participating binding cannot claim isolation restoration");
    }
    previous_isolation_level_ = level;
    isolation_recorded_ = true;
    return common::Status::OK();
}

common::Status TransactionBinding::SetMustRestoreAutoCommit(bool must_restore) {
    if (restoration_consumed_) {
        return FromTransactionError(TransactionErrorCode::kProtocolViolation,
                                    "auto-commit obligation written after restoration");
    }
    if (participating_ && must_restore) {
        return FromTransactionError(TransactionErrorCode::kProtocolViolation,
                                    "participating binding cannot claim auto-commit restoration");
    }
    must_restore_auto_commit_ = must_restore;
    return common::Status::OK();
}

RestorationPlan TransactionBinding::TakeRestoration() {
    RestorationPlan plan;
    if (restoration_consumed_) {
        return plan;
    }
    plan.previous_isolation_level = std::exchange(previous_isolation_level_, std::nullopt);
    plan.restore_auto_commit = std::exchange(must_restore_auto_commit_, false);
    restoration_consumed_ = true;
    return plan;
}

}
}
