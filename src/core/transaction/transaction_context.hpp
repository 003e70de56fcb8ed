#pragma once

#include "common/status.hpp"
#include "core/transaction/resource.hpp"
#include "core/transaction/resource_holder.hpp"
#include "core/transaction/transaction_synchronization.hpp"

#include <map>
#include <memory>
#include <vector>

namespace txbind {
namespace core {

// 执行上下文中的事务状态
// 由调用方显式传递给事务管理器, 取代线程局部存储
// 只能被一个执行上下文使用, 内部不加锁
class TransactionContext {
public:
    TransactionContext() = default;
    TransactionContext(const TransactionContext&) = delete;
    TransactionContext& operator=(const TransactionContext&) = delete;

    // 资源绑定, 以资源工厂作为键
    common::Status BindResource(const ResourceFactory* key, std::shared_ptr<ResourceHolder> holder);
    std::shared_ptr<ResourceHolder> GetResource(const ResourceFactory* key) const;
    bool HasResource(const ResourceFactory* key) const;
    common::Status UnbindResource(const ResourceFactory* key);
    std::size_t BoundResourceCount() const { return resources_.size(); }

    // 完成回调
    common::Status InitSynchronization();
    bool IsSynchronizationActive() const noexcept { return synchronization_active_; }
    common::Status RegisterSynchronization(std::shared_ptr<TransactionSynchronization> synchronization);
    const std::vector<std::shared_ptr<TransactionSynchronization>>& GetSynchronizations() const {
        return synchronizations_;
    }
    void ClearSynchronization();

private:
    std::map<const ResourceFactory*, std::shared_ptr<ResourceHolder>> resources_;
    bool synchronization_active_ = false;
    std::vector<std::shared_ptr<TransactionSynchronization>> synchronizations_;
};

}
}
