#include "core/transaction/transaction_status.hpp"

namespace txbind {
namespace core {

TransactionStatus::TransactionStatus(std::shared_ptr<TransactionBinding> binding,
                                     std::shared_ptr<ResourceHolder> holder,
                                     TransactionDefinition definition,
                                     bool new_transaction,
                                     bool new_synchronization)
    : binding_(std::move(binding)),
      holder_(std::move(holder)),
      definition_(std::move(definition)),
      new_transaction_(new_transaction),
      new_synchronization_(new_synchronization) {}

bool TransactionStatus::IsGlobalRollbackOnly() const noexcept {
    return holder_ != nullptr && holder_->IsRollbackOnly();
}

}
}
