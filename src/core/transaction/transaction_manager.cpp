#include "core/transaction/transaction_manager.hpp"

#include "common/logger.hpp"
#include "core/transaction/errors.hpp"

#include <exception>
#include <utility>
#include <vector>

namespace txbind {
namespace core {

namespace {

using common::Status;

// 合并主错误和次要错误, 主错误为 OK 时次要错误升为主错误
Status Compose(Status primary, Status secondary) {
    if (secondary.IsOk()) {
        return primary;
    }
    if (primary.IsOk()) {
        return secondary;
    }
    primary.AddSuppressed(std::move(secondary));
    return primary;
}

// 回调异常转换为 Status, 不吞掉
template <typename Callback>
Status InvokeSynchronizations(const std::vector<std::shared_ptr<TransactionSynchronization>>& synchronizations,
                              const char* phase, Callback&& callback) {
    Status result = Status::OK();
    for (const auto& synchronization : synchronizations) {
        try {
            callback(*synchronization);
        } catch (const std::exception& ex) {
            result = Compose(std::move(result),
                             Status::Internal(std::string(phase) + " synchronization failed: " + ex.what()));
        } catch (...) {
            result = Compose(std::move(result),
                             Status::Internal(std::string(phase) + " synchronization threw an unknown exception"));
        }
    }
    return result;
}

} // namespace

ResourceTransactionManager::ResourceTransactionManager(std::shared_ptr<ResourceFactory> factory,
                                                       TransactionManagerConfig config)
    : factory_(std::move(factory)), config_(config) {}

TransactionDefinition ResourceTransactionManager::ApplyDefaults(const TransactionDefinition& definition) const {
    TransactionDefinition effective = definition;
    if (effective.timeout_seconds == kTimeoutDefault) {
        effective.timeout_seconds = config_.default_timeout_seconds;
    }
    if (effective.isolation_level == isolation::kDefault) {
        effective.isolation_level = config_.default_isolation;
    }
    return effective;
}

ResourceTransactionManager::StatusOrTransaction ResourceTransactionManager::GetTransaction(
    TransactionContext& context, const TransactionDefinition& requested) {
    if (requested.timeout_seconds < kTimeoutDefault) {
        return FromTransactionError(TransactionErrorCode::kInvalidTimeout,
                                    "timeout " + std::to_string(requested.timeout_seconds) + "s");
    }
    // 参与事务按调用方原始请求检查隔离级别, 默认值只用于新事务
    auto holder = context.GetResource(factory_.get());
    if (holder && holder->IsTransactionActive()) {
        TXBIND_LOG_DEBUG("Participating in existing transaction on {}", holder->Resource()->Describe());
        return HandleExistingTransaction(context, requested, std::move(holder));
    }
    const TransactionDefinition definition = ApplyDefaults(requested);

    switch (definition.propagation) {
        case Propagation::kMandatory:
            return FromTransactionError(TransactionErrorCode::kNoTransaction,
                                        "propagation MANDATORY but no existing transaction found");
        case Propagation::kRequired:
            TXBIND_LOG_DEBUG("Creating new transaction \"{}\" with isolation {}",
                             definition.name, IsolationLevelToString(definition.isolation_level));
            return StartNewTransaction(context, definition);
        case Propagation::kSupports:
            break;
    }

    // 空事务, 只可能需要完成回调
    bool new_synchronization = InitSynchronizationIfNeeded(context, config_.synchronization == SynchronizationMode::kAlways);
    return StatusOrTransaction(TransactionStatus(nullptr, nullptr, definition, false, new_synchronization));
}

ResourceTransactionManager::StatusOrTransaction ResourceTransactionManager::HandleExistingTransaction(
    TransactionContext& context, const TransactionDefinition& definition, std::shared_ptr<ResourceHolder> holder) {
    auto binding = std::make_shared<TransactionBinding>(TransactionBinding::NewForExistingHolder(holder.get()));

    if (definition.isolation_level != isolation::kDefault) {
        auto current = holder->Resource()->GetIsolationLevel();
        if (!current.IsOk()) {
            return current.GetStatus();
        }
        if (current.Value() != definition.isolation_level) {
            const std::string message = "participating transaction requested " +
                                        IsolationLevelToString(definition.isolation_level) +
                                        " but the existing transaction runs at " +
                                        IsolationLevelToString(current.Value());
            if (config_.nested_isolation_policy == NestedIsolationPolicy::kReject) {
                TXBIND_LOG_WARN("Rejecting nested transaction: {}", message);
                return FromTransactionError(TransactionErrorCode::kConfiguration, message);
            }
            TXBIND_LOG_WARN("Ignoring nested isolation request: {}", message);
        }
    }

    // 参与事务不改动资源, 记录"无需恢复"
    Status recorded = binding->SetPreviousIsolationLevel(std::nullopt);
    if (!recorded.IsOk()) {
        TXBIND_LOG_ERROR("{}", recorded.Message());
        return recorded;
    }

    holder->Requested();
    bool new_synchronization = InitSynchronizationIfNeeded(context, config_.synchronization != SynchronizationMode::kNever);
    return StatusOrTransaction(
        TransactionStatus(std::move(binding), std::move(holder), definition, false, new_synchronization));
}

ResourceTransactionManager::StatusOrTransaction ResourceTransactionManager::StartNewTransaction(
    TransactionContext& context, const TransactionDefinition& definition) {
    auto resource_or = factory_->Acquire();
    if (!resource_or.IsOk()) {
        return FromTransactionError(TransactionErrorCode::kCannotCreate, resource_or.GetStatus().Message());
    }
    auto holder = std::make_shared<ResourceHolder>(std::move(resource_or.Value()));
    holder->SetNew(true);

    auto binding = std::make_shared<TransactionBinding>(TransactionBinding::NewForHolder());
    Status status = binding->SetHolder(holder.get());
    if (!status.IsOk()) {
        return status;
    }

    status = PrepareResource(*binding, *holder->Resource(), definition);
    if (!status.IsOk()) {
        // 撤销已做的修改, holder 析构时归还资源
        const bool reset_read_only = config_.enforce_read_only && definition.read_only;
        status.AddSuppressed(RestoreResource(*binding, *holder->Resource(), reset_read_only));
        return status;
    }

    if (definition.timeout_seconds != kTimeoutDefault) {
        holder->SetTimeoutInSeconds(definition.timeout_seconds);
    }
    holder->Requested();
    holder->SetTransactionActive(true);

    status = context.BindResource(factory_.get(), holder);
    if (!status.IsOk()) {
        TXBIND_LOG_ERROR("Failed to bind resource: {}", status.Message());
        const bool reset_read_only = config_.enforce_read_only && definition.read_only;
        status.AddSuppressed(RestoreResource(*binding, *holder->Resource(), reset_read_only));
        return status;
    }

    bool new_synchronization = InitSynchronizationIfNeeded(context, config_.synchronization != SynchronizationMode::kNever);
    TXBIND_LOG_DEBUG("Began transaction on {}", holder->Resource()->Describe());
    return StatusOrTransaction(
        TransactionStatus(std::move(binding), std::move(holder), definition, true, new_synchronization));
}

Status ResourceTransactionManager::PrepareResource(TransactionBinding& binding, TransactionalResource& resource,
                                                   const TransactionDefinition& definition) {
    // 修改前先读取原始设置
    auto current_level = resource.GetIsolationLevel();
    if (!current_level.IsOk()) {
        return FromTransactionError(TransactionErrorCode::kCannotCreate,
                                    "could not read isolation level: " + current_level.GetStatus().Message());
    }
    auto auto_commit = resource.GetAutoCommit();
    if (!auto_commit.IsOk()) {
        return FromTransactionError(TransactionErrorCode::kCannotCreate,
                                    "could not read auto-commit: " + auto_commit.GetStatus().Message());
    }

    const int requested = definition.isolation_level;
    if (requested != isolation::kDefault && !IsValidIsolationLevel(requested)) {
        return FromTransactionError(TransactionErrorCode::kConfiguration,
                                    "invalid isolation level " + std::to_string(requested));
    }
    if (requested != isolation::kDefault && requested != current_level.Value()) {
        TXBIND_LOG_DEBUG("Changing isolation level of {} from {} to {}", resource.Describe(),
                         IsolationLevelToString(current_level.Value()), IsolationLevelToString(requested));
        Status recorded = binding.SetPreviousIsolationLevel(current_level.Value());
        if (!recorded.IsOk()) {
            TXBIND_LOG_ERROR("{}", recorded.Message());
            return recorded;
        }
        Status changed = resource.SetIsolationLevel(requested);
        if (!changed.IsOk()) {
            // 资源未被修改, 丢弃恢复记录
            binding.TakeRestoration();
            return FromTransactionError(TransactionErrorCode::kConfiguration,
                                        "resource rejected isolation level " + IsolationLevelToString(requested) +
                                        ": " + changed.Message());
        }
    } else {
        Status recorded = binding.SetPreviousIsolationLevel(std::nullopt);
        if (!recorded.IsOk()) {
            TXBIND_LOG_ERROR("{}", recorded.Message());
            return recorded;
        }
    }

    // 自动提交已关闭说明资源处于外部管理的事务中, 不接管
    if (auto_commit.Value()) {
        Status disabled = resource.SetAutoCommit(false);
        if (!disabled.IsOk()) {
            return FromTransactionError(TransactionErrorCode::kCannotCreate,
                                        "could not disable auto-commit: " + disabled.Message());
        }
        Status recorded = binding.SetMustRestoreAutoCommit(true);
        if (!recorded.IsOk()) {
            TXBIND_LOG_ERROR("{}", recorded.Message());
            return recorded;
        }
    }

    if (config_.enforce_read_only && definition.read_only) {
        Status read_only = resource.SetReadOnly(true);
        if (!read_only.IsOk()) {
            return FromTransactionError(TransactionErrorCode::kCannotCreate,
                                        "could not set read-only: " + read_only.Message());
        }
    }
    return Status::OK();
}

Status ResourceTransactionManager::RestoreResource(TransactionBinding& binding, TransactionalResource& resource,
                                                   bool reset_read_only) {
    RestorationPlan plan = binding.TakeRestoration();
    Status result = Status::OK();

    if (plan.restore_auto_commit) {
        Status restored = resource.SetAutoCommit(true);
        if (!restored.IsOk()) {
            result = Compose(std::move(result),
                             FromTransactionError(TransactionErrorCode::kRestoration,
                                                  "could not re-enable auto-commit on " + resource.Describe() +
                                                  ": " + restored.Message()));
        }
    }
    if (plan.previous_isolation_level) {
        TXBIND_LOG_DEBUG("Resetting isolation level of {} to {}", resource.Describe(),
                         IsolationLevelToString(*plan.previous_isolation_level));
        Status restored = resource.SetIsolationLevel(*plan.previous_isolation_level);
        if (!restored.IsOk()) {
            result = Compose(std::move(result),
                             FromTransactionError(TransactionErrorCode::kRestoration,
                                                  "could not reset isolation level on " + resource.Describe() +
                                                  " to " + IsolationLevelToString(*plan.previous_isolation_level) +
                                                  ": " + restored.Message()));
        }
    }
    if (reset_read_only) {
        Status restored = resource.SetReadOnly(false);
        if (!restored.IsOk()) {
            result = Compose(std::move(result),
                             FromTransactionError(TransactionErrorCode::kRestoration,
                                                  "could not reset read-only on " + resource.Describe() +
                                                  ": " + restored.Message()));
        }
    }
    if (!result.IsOk()) {
        TXBIND_LOG_ERROR("Restoring resource settings failed: {}", result.ToString());
    }
    return result;
}

Status ResourceTransactionManager::Commit(TransactionContext& context, TransactionStatus& status) {
    if (status.IsCompleted()) {
        Status violation = FromTransactionError(TransactionErrorCode::kProtocolViolation,
                                                "transaction is already completed");
        TXBIND_LOG_ERROR("{}", violation.Message());
        return violation;
    }
    try {
        return ProcessCommit(context, status);
    } catch (...) {
        CompleteAfterException(context, status);
        throw;
    }
}

Status ResourceTransactionManager::ProcessCommit(TransactionContext& context, TransactionStatus& status) {
    if (status.IsRollbackOnly()) {
        TXBIND_LOG_DEBUG("Transactional code has requested rollback");
        return ProcessRollback(context, status, Status::OK());
    }
    if (status.IsNewTransaction() && status.IsGlobalRollbackOnly()) {
        TXBIND_LOG_DEBUG("Global transaction is marked as rollback-only but commit was requested");
        return ProcessRollback(context, status,
                               FromTransactionError(TransactionErrorCode::kUnexpectedRollback,
                                                    "transaction rolled back because it was marked rollback-only"));
    }
    if (status.IsNewTransaction() && status.Holder()->IsDeadlineExpired()) {
        TXBIND_LOG_WARN("Transaction \"{}\" exceeded its timeout of {}s, rolling back",
                        status.Definition().name, status.Definition().timeout_seconds);
        return ProcessRollback(context, status,
                               FromTransactionError(TransactionErrorCode::kTimedOut,
                                                    "deadline expired before commit"));
    }

    Status result = Status::OK();
    CompletionStatus completion = CompletionStatus::kCommitted;

    if (status.IsNewSynchronization()) {
        result = TriggerBeforeCommit(context, status);
        result = Compose(std::move(result), TriggerBeforeCompletion(context, status));
    }

    if (!result.IsOk()) {
        // 回调失败, 与提交失败同样处理: 新事务直接回滚
        if (status.IsNewTransaction()) {
            Status rolled_back = DoRollback(status);
            completion = rolled_back.IsOk() ? CompletionStatus::kRolledBack : CompletionStatus::kUnknown;
            result = Compose(std::move(result), std::move(rolled_back));
        } else {
            completion = CompletionStatus::kRolledBack;
        }
    } else if (status.IsNewTransaction()) {
        TXBIND_LOG_DEBUG("Initiating transaction commit");
        Status committed = DoCommit(status);
        if (!committed.IsOk()) {
            result = std::move(committed);
            completion = CompletionStatus::kUnknown;
            if (config_.rollback_on_commit_failure) {
                TXBIND_LOG_DEBUG("Initiating transaction rollback on commit failure");
                Status rolled_back = DoRollback(status);
                if (rolled_back.IsOk()) {
                    completion = CompletionStatus::kRolledBack;
                } else {
                    TXBIND_LOG_ERROR("Commit failure overridden by rollback failure: {}", result.Message());
                    result.AddSuppressed(std::move(rolled_back));
                }
            }
        }
    }

    if (status.IsNewSynchronization()) {
        result = Compose(std::move(result), TriggerAfterCompletion(context, status, completion));
    }
    return Compose(std::move(result), CleanupAfterCompletion(context, status));
}

Status ResourceTransactionManager::Rollback(TransactionContext& context, TransactionStatus& status) {
    if (status.IsCompleted()) {
        Status violation = FromTransactionError(TransactionErrorCode::kProtocolViolation,
                                                "transaction is already completed");
        TXBIND_LOG_ERROR("{}", violation.Message());
        return violation;
    }
    try {
        return ProcessRollback(context, status, Status::OK());
    } catch (...) {
        CompleteAfterException(context, status);
        throw;
    }
}

void ResourceTransactionManager::CompleteAfterException(TransactionContext& context,
                                                        TransactionStatus& status) noexcept {
    if (status.IsCompleted()) {
        return;
    }
    TXBIND_LOG_ERROR("Transaction completion interrupted by an exception, rolling back and releasing resource");
    // 异常中断时仍要回滚, 恢复设置并释放资源; 原异常由调用方重新抛出
    try {
        if (status.IsNewTransaction() && status.Holder() != nullptr) {
            Status rolled_back = DoRollback(status);
            if (!rolled_back.IsOk()) {
                TXBIND_LOG_ERROR("{}", rolled_back.Message());
            }
        }
    } catch (const std::exception& ex) {
        TXBIND_LOG_ERROR("Rollback after exception failed: {}", ex.what());
    } catch (...) {
        TXBIND_LOG_ERROR("Rollback after exception failed with an unknown exception");
    }
    try {
        Status cleaned = CleanupAfterCompletion(context, status);
        if (!cleaned.IsOk()) {
            TXBIND_LOG_ERROR("Cleanup after exception failed: {}", cleaned.ToString());
        }
    } catch (const std::exception& ex) {
        TXBIND_LOG_ERROR("Cleanup after exception failed: {}", ex.what());
    } catch (...) {
        TXBIND_LOG_ERROR("Cleanup after exception failed with an unknown exception");
    }
    // 清理本身中途抛出: 至少解除绑定并释放资源, 避免后续作用域加入已失效的事务
    if (!status.IsCompleted()) {
        ResourceHolder* holder = status.Holder();
        if (status.IsNewTransaction() && holder != nullptr) {
            holder->Clear();
            if (context.GetResource(factory_.get()).get() == holder) {
                Status unbound = context.UnbindResource(factory_.get());
                if (!unbound.IsOk()) {
                    TXBIND_LOG_ERROR("{}", unbound.Message());
                }
            }
        } else if (holder != nullptr) {
            holder->Released();
        }
        if (status.IsNewSynchronization()) {
            context.ClearSynchronization();
        }
        status.ReleaseHolder();
        status.MarkCompleted();
    }
}

Status ResourceTransactionManager::ProcessRollback(TransactionContext& context, TransactionStatus& status,
                                                   Status reason) {
    Status result = std::move(reason);
    CompletionStatus completion = CompletionStatus::kRolledBack;

    if (status.IsNewSynchronization()) {
        result = Compose(std::move(result), TriggerBeforeCompletion(context, status));
    }

    if (status.IsNewTransaction()) {
        TXBIND_LOG_DEBUG("Initiating transaction rollback");
        Status rolled_back = DoRollback(status);
        if (!rolled_back.IsOk()) {
            completion = CompletionStatus::kUnknown;
            result = Compose(std::move(result), std::move(rolled_back));
        }
    } else if (status.HasTransaction()) {
        TXBIND_LOG_DEBUG("Setting existing transaction rollback-only");
        status.Holder()->SetRollbackOnly();
    } else {
        TXBIND_LOG_DEBUG("Should roll back transaction but cannot - no transaction available");
    }

    if (status.IsNewSynchronization()) {
        result = Compose(std::move(result), TriggerAfterCompletion(context, status, completion));
    }
    return Compose(std::move(result), CleanupAfterCompletion(context, status));
}

Status ResourceTransactionManager::DoCommit(TransactionStatus& status) {
    TransactionalResource* resource = status.Holder()->Resource();
    Status committed = resource->Commit();
    if (!committed.IsOk()) {
        return FromTransactionError(TransactionErrorCode::kCommitFailed,
                                    "could not commit on " + resource->Describe() + ": " + committed.Message());
    }
    return Status::OK();
}

Status ResourceTransactionManager::DoRollback(TransactionStatus& status) {
    TransactionalResource* resource = status.Holder()->Resource();
    Status rolled_back = resource->Rollback();
    if (!rolled_back.IsOk()) {
        return FromTransactionError(TransactionErrorCode::kRollbackFailed,
                                    "could not roll back on " + resource->Describe() + ": " + rolled_back.Message());
    }
    return Status::OK();
}

Status ResourceTransactionManager::CleanupAfterCompletion(TransactionContext& context, TransactionStatus& status) {
    Status result = Status::OK();
    if (status.IsNewSynchronization()) {
        context.ClearSynchronization();
    }

    if (status.IsNewTransaction() && status.Holder() != nullptr) {
        ResourceHolder* holder = status.Holder();
        // 先恢复再释放, 资源归还连接池前设置已复原
        result = RestoreResource(*status.Binding(), *holder->Resource(), ShouldResetReadOnly(status));
        holder->Clear();
        holder->Released();
        Status unbound = context.UnbindResource(factory_.get());
        if (!unbound.IsOk()) {
            TXBIND_LOG_ERROR("{}", unbound.Message());
            result = Compose(std::move(result), std::move(unbound));
        }
        TXBIND_LOG_DEBUG("Releasing resource {} after transaction", holder->Resource()->Describe());
        status.ReleaseHolder();
    } else if (status.HasTransaction() && !status.IsNewTransaction() && status.Holder() != nullptr) {
        // 参与事务只归还引用计数, 设置由外层恢复
        status.Holder()->Released();
        status.ReleaseHolder();
    }

    status.MarkCompleted();
    return result;
}

bool ResourceTransactionManager::InitSynchronizationIfNeeded(TransactionContext& context, bool wanted) {
    if (!wanted || context.IsSynchronizationActive()) {
        return false;
    }
    Status initialized = context.InitSynchronization();
    if (!initialized.IsOk()) {
        TXBIND_LOG_ERROR("{}", initialized.Message());
        return false;
    }
    return true;
}

Status ResourceTransactionManager::TriggerBeforeCommit(TransactionContext& context, const TransactionStatus& status) {
    const bool read_only = status.Definition().read_only;
    return InvokeSynchronizations(context.GetSynchronizations(), "beforeCommit",
                                  [read_only](TransactionSynchronization& s) { s.BeforeCommit(read_only); });
}

Status ResourceTransactionManager::TriggerBeforeCompletion(TransactionContext& context, const TransactionStatus&) {
    return InvokeSynchronizations(context.GetSynchronizations(), "beforeCompletion",
                                  [](TransactionSynchronization& s) { s.BeforeCompletion(); });
}

Status ResourceTransactionManager::TriggerAfterCompletion(TransactionContext& context, const TransactionStatus&,
                                                          CompletionStatus completion) {
    TXBIND_LOG_DEBUG("Triggering afterCompletion synchronization ({})", CompletionStatusToString(completion));
    return InvokeSynchronizations(context.GetSynchronizations(), "afterCompletion",
                                  [completion](TransactionSynchronization& s) { s.AfterCompletion(completion); });
}

bool ResourceTransactionManager::ShouldResetReadOnly(const TransactionStatus& status) const {
    return config_.enforce_read_only && status.Definition().read_only;
}

}
}
