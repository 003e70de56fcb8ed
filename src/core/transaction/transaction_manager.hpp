#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/transaction/resource.hpp"
#include "core/transaction/transaction_context.hpp"
#include "core/transaction/transaction_definition.hpp"
#include "core/transaction/transaction_manager_config.hpp"
#include "core/transaction/transaction_status.hpp"

#include <memory>

namespace txbind {
namespace core {

// 基于单一资源工厂的事务管理器
//
// 开始事务时读取资源当前的隔离级别和自动提交, 按需修改并把原值记入绑定;
// 提交或回滚后无论成败都会执行一次恢复, 然后解除上下文绑定并释放资源.
// 参与已有事务的作用域不修改资源, 也不解除绑定.
//
// 事务状态通过 TransactionContext 显式传递, 管理器本身无可变状态, 可被多个执行上下文共享
class ResourceTransactionManager {
public:
    using Status = common::Status;
    using StatusOrTransaction = common::StatusOr<TransactionStatus>;

    explicit ResourceTransactionManager(std::shared_ptr<ResourceFactory> factory,
                                        TransactionManagerConfig config = TransactionManagerConfig());

    // 按传播行为加入已有事务或开始新事务
    StatusOrTransaction GetTransaction(TransactionContext& context,
                                       const TransactionDefinition& definition = TransactionDefinition());

    // 提交; 仅回滚标记或超时会转为回滚
    Status Commit(TransactionContext& context, TransactionStatus& status);

    // 回滚; 参与事务只设置仅回滚标记
    Status Rollback(TransactionContext& context, TransactionStatus& status);

    const TransactionManagerConfig& Config() const noexcept { return config_; }
    const ResourceFactory* Key() const noexcept { return factory_.get(); }

private:
    TransactionDefinition ApplyDefaults(const TransactionDefinition& definition) const;

    StatusOrTransaction HandleExistingTransaction(TransactionContext& context,
                                                  const TransactionDefinition& definition,
                                                  std::shared_ptr<ResourceHolder> holder);
    StatusOrTransaction StartNewTransaction(TransactionContext& context, const TransactionDefinition& definition);

    // 读取原始设置并修改资源, 原值记入绑定
    Status PrepareResource(TransactionBinding& binding, TransactionalResource& resource,
                           const TransactionDefinition& definition);

    // 消费绑定中的恢复计划并执行, 两项恢复互不影响, 失败均报告
    Status RestoreResource(TransactionBinding& binding, TransactionalResource& resource, bool reset_read_only);

    // 回滚路径, reason 非 OK 时作为主错误返回
    Status ProcessRollback(TransactionContext& context, TransactionStatus& status, Status reason);

    Status ProcessCommit(TransactionContext& context, TransactionStatus& status);

    // 回调或资源抛出异常时的兜底: 回滚并执行清理, 不再抛出
    void CompleteAfterException(TransactionContext& context, TransactionStatus& status) noexcept;

    Status DoCommit(TransactionStatus& status);
    Status DoRollback(TransactionStatus& status);

    // 保证执行的清理: 恢复设置, 解除绑定, 释放资源
    Status CleanupAfterCompletion(TransactionContext& context, TransactionStatus& status);

    bool InitSynchronizationIfNeeded(TransactionContext& context, bool wanted);
    Status TriggerBeforeCommit(TransactionContext& context, const TransactionStatus& status);
    Status TriggerBeforeCompletion(TransactionContext& context, const TransactionStatus& status);
    Status TriggerAfterCompletion(TransactionContext& context, const TransactionStatus& status,
                                  CompletionStatus completion);

    bool ShouldResetReadOnly(const TransactionStatus& status) const;

    std::shared_ptr<ResourceFactory> factory_;
    TransactionManagerConfig config_;
};

}
}
