#pragma once

#include "core/transaction/resource.hpp"

#include <chrono>
#include <memory>
#include <optional>

namespace txbind {
namespace core {

// 资源持有者, 独占一个物理资源, 在同一执行上下文的嵌套作用域之间共享
// 资源只在持有者销毁时释放(归还连接池)
class ResourceHolder {
public:
    using Clock = std::chrono::steady_clock;

    explicit ResourceHolder(std::unique_ptr<TransactionalResource> resource);
    ResourceHolder(const ResourceHolder&) = delete;
    ResourceHolder& operator=(const ResourceHolder&) = delete;

    TransactionalResource* Resource() const noexcept { return resource_.get(); }

    // 是否由当前事务管理器为本次事务新建
    bool IsNew() const noexcept { return is_new_; }
    void SetNew(bool is_new) noexcept { is_new_ = is_new; }

    // 引用计数, 记录嵌套作用域对资源的使用
    void Requested() noexcept { ++reference_count_; }
    void Released() noexcept;
    bool IsOpen() const noexcept { return reference_count_ > 0; }
    int ReferenceCount() const noexcept { return reference_count_; }

    bool IsTransactionActive() const noexcept { return transaction_active_; }
    void SetTransactionActive(bool active) noexcept { transaction_active_ = active; }

    // 参与事务回滚时由内层作用域设置, 外层提交将转为回滚
    void SetRollbackOnly() noexcept { rollback_only_ = true; }
    bool IsRollbackOnly() const noexcept { return rollback_only_; }

    // 截止时间
    void SetTimeoutInSeconds(int seconds, Clock::time_point now = Clock::now());
    bool HasTimeout() const noexcept { return deadline_.has_value(); }
    bool IsDeadlineExpired(Clock::time_point now = Clock::now()) const noexcept;
    // 剩余时间, 未设置截止时间时返回空
    std::optional<std::chrono::milliseconds> TimeToLive(Clock::time_point now = Clock::now()) const;

    // 清空事务相关状态, 资源本身保留
    void Clear() noexcept;

private:
    std::unique_ptr<TransactionalResource> resource_;
    bool is_new_ = false;
    bool transaction_active_ = false;
    bool rollback_only_ = false;
    int reference_count_ = 0;
    std::optional<Clock::time_point> deadline_;
};

}
}
