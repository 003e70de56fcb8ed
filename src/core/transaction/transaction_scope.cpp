#include "core/transaction/transaction_scope.hpp"

#include "common/logger.hpp"
#include "core/transaction/errors.hpp"

#include <exception>
#include <string>

namespace txbind {
namespace core {

TransactionScope::TransactionScope(ResourceTransactionManager& manager, TransactionContext& context,
                                   TransactionDefinition definition)
    : manager_(manager), context_(context), definition_(std::move(definition)) {}

TransactionScope::~TransactionScope() {
    if (!IsActive()) {
        return;
    }
    // 析构函数不能抛出, 资源已由管理器清理, 这里只记录
    try {
        common::Status status = Rollback();
        if (!status.IsOk()) {
            TXBIND_LOG_ERROR("Rollback of abandoned transaction scope failed: {}", status.ToString());
        }
    } catch (const std::exception& ex) {
        TXBIND_LOG_ERROR("Rollback of abandoned transaction scope threw: {}", ex.what());
    } catch (...) {
        TXBIND_LOG_ERROR("Rollback of abandoned transaction scope threw an unknown exception");
    }
}

common::Status TransactionScope::Begin() {
    if (status_.has_value()) {
        return FromTransactionError(TransactionErrorCode::kProtocolViolation, "transaction scope already begun");
    }
    auto status_or = manager_.GetTransaction(context_, definition_);
    if (!status_or.IsOk()) {
        return status_or.GetStatus();
    }
    status_.emplace(std::move(status_or).Value());
    return common::Status::OK();
}

common::Status TransactionScope::Commit() {
    if (!status_) {
        return FromTransactionError(TransactionErrorCode::kProtocolViolation, "transaction scope not begun");
    }
    return manager_.Commit(context_, *status_);
}

common::Status TransactionScope::Rollback() {
    if (!status_) {
        return FromTransactionError(TransactionErrorCode::kProtocolViolation, "transaction scope not begun");
    }
    return manager_.Rollback(context_, *status_);
}

void TransactionScope::SetRollbackOnly() {
    if (status_) {
        status_->SetRollbackOnly();
    }
}

TransactionalResource* TransactionScope::Resource() const noexcept {
    if (!status_ || status_->Holder() == nullptr) {
        return nullptr;
    }
    return status_->Holder()->Resource();
}

common::Status ExecuteInTransaction(ResourceTransactionManager& manager,
                                    TransactionContext& context,
                                    const TransactionDefinition& definition,
                                    const TransactionCallback& callback) {
    auto status_or = manager.GetTransaction(context, definition);
    if (!status_or.IsOk()) {
        return status_or.GetStatus();
    }
    TransactionStatus status = std::move(status_or).Value();

    common::Status result = common::Status::OK();
    try {
        result = callback(status);
    } catch (const std::exception& ex) {
        result = common::Status::Internal(std::string("transaction callback threw: ") + ex.what());
    } catch (...) {
        // 未知异常原样抛给调用方, 抛出前先回滚并释放资源
        TXBIND_LOG_ERROR("Transaction callback threw an unknown exception, rolling back");
        common::Status rolled_back = manager.Rollback(context, status);
        if (!rolled_back.IsOk()) {
            TXBIND_LOG_ERROR("Rollback after callback exception failed: {}", rolled_back.ToString());
        }
        throw;
    }

    if (!result.IsOk()) {
        TXBIND_LOG_DEBUG("Transaction callback failed, rolling back: {}", result.Message());
        result.AddSuppressed(manager.Rollback(context, status));
        return result;
    }
    return manager.Commit(context, status);
}

}
}
