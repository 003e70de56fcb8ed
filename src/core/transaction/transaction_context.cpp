#include "core/transaction/transaction_context.hpp"

#include "core/transaction/errors.hpp"

namespace txbind {
namespace core {

common::Status TransactionContext::BindResource(const ResourceFactory* key, std::shared_ptr<ResourceHolder> holder) {
    if (key == nullptr || !holder) {
        return FromTransactionError(TransactionErrorCode::kProtocolViolation, "cannot bind a null resource");
    }
    auto inserted = resources_.emplace(key, std::move(holder));
    if (!inserted.second) {
        return FromTransactionError(TransactionErrorCode::kProtocolViolation,
                                    "a resource is already bound for this factory");
    }
    return common::Status::OK();
}

std::shared_ptr<ResourceHolder> TransactionContext::GetResource(const ResourceFactory* key) const {
    auto it = resources_.find(key);
    if (it == resources_.end()) {
        return nullptr;
    }
    return it->second;
}

bool TransactionContext::HasResource(const ResourceFactory* key) const {
    return resources_.find(key) != resources_.end();
}

common::Status TransactionContext::UnbindResource(const ResourceFactory* key) {
    auto it = resources_.find(key);
    if (it == resources_.end()) {
        return FromTransactionError(TransactionErrorCode::kProtocolViolation,
                                    "no resource bound for this factory");
    }
    resources_.erase(it);
    return common::Status::OK();
}

common::Status TransactionContext::InitSynchronization() {
    if (synchronization_active_) {
        return FromTransactionError(TransactionErrorCode::kProtocolViolation,
                                    "synchronization already active");
    }
    synchronization_active_ = true;
    synchronizations_.clear();
    return common::Status::OK();
}

common::Status TransactionContext::RegisterSynchronization(std::shared_ptr<TransactionSynchronization> synchronization) {
    if (!synchronization_active_) {
        return FromTransactionError(TransactionErrorCode::kProtocolViolation,
                                    "synchronization is not active");
    }
    if (!synchronization) {
        return common::Status::InvalidArgument("synchronization must not be null");
    }
    synchronizations_.push_back(std::move(synchronization));
    return common::Status::OK();
}

void TransactionContext::ClearSynchronization() {
    synchronization_active_ = false;
    synchronizations_.clear();
}

}
}
