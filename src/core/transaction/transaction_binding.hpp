#pragma once

#include "common/status.hpp"
#include "core/transaction/resource_holder.hpp"

#include <optional>

namespace txbind {
namespace core {

// 完成事务时需要执行的恢复动作
struct RestorationPlan {
    std::optional<int> previous_isolation_level; // 为空表示不恢复隔离级别
    bool restore_auto_commit = false;

    bool Empty() const { return !previous_isolation_level.has_value() && !restore_auto_commit; }
};

// 单个事务的资源绑定记录
//
// 记录事务管理器在开始事务时改动过的连接设置, 保证完成时恰好恢复一次:
//  * previous_isolation_level 每次开始事务最多写入一次, 为空表示未改动
//  * must_restore_auto_commit 只在确实观察到自动提交开启并将其关闭后为 true
//  * 加入已有持有者的绑定(参与事务)不得声明任何恢复责任, 由外层绑定负责
//  * TakeRestoration() 是完成时唯一的消费性读取, 之后再次调用返回空计划
//
// 持有者引用是借用的, 生命周期由事务管理器管理
// 绑定只属于一个执行上下文, 不做任何加锁
class TransactionBinding {
public:
    // 尚未确定物理资源时使用, 之后通过 SetHolder 绑定
    static TransactionBinding NewForHolder();
    // 加入当前上下文中已存在的事务
    static TransactionBinding NewForExistingHolder(ResourceHolder* holder);

    common::Status SetHolder(ResourceHolder* holder);
    ResourceHolder* GetHolder() const noexcept { return holder_; }

    common::Status SetPreviousIsolationLevel(std::optional<int> level);
    const std::optional<int>& GetPreviousIsolationLevel() const noexcept { return previous_isolation_level_; }

    common::Status SetMustRestoreAutoCommit(bool must_restore);
    bool GetMustRestoreAutoCommit() const noexcept { return must_restore_auto_commit_; }

    RestorationPlan TakeRestoration();

    bool IsParticipating() const noexcept { return participating_; }
    bool IsRestorationConsumed() const noexcept { return restoration_consumed_; }
    bool HasRestorationWork() const noexcept {
        return previous_isolation_level_.has_value() || must_restore_auto_commit_;
    }

private:
    TransactionBinding() = default;

    ResourceHolder* holder_ = nullptr;
    std::optional<int> previous_isolation_level_;
    bool must_restore_auto_commit_ = false;

    bool participating_ = false;
    bool isolation_recorded_ = false;
    bool restoration_consumed_ = false;
};

}
}
