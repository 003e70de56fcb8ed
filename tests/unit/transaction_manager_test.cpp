#include "core/transaction/transaction_manager.hpp"
#include "test_memory_utils.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace txbind::core;
using txbind::common::StatusCode;
using txbind::storage::MemoryConnection;

class TransactionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Build(isolation::kReadCommitted, true);
    }

    void Build(int isolation_level, bool auto_commit, TransactionManagerConfig config = TransactionManagerConfig()) {
        pool_ = testutils::MakeMemoryPool(1, isolation_level, auto_commit);
        manager_ = std::make_unique<ResourceTransactionManager>(pool_, config);
    }

    MemoryConnection& Connection() { return pool_->ConnectionAt(0); }

    TransactionStatus Begin(const TransactionDefinition& definition) {
        auto status_or = manager_->GetTransaction(context_, definition);
        EXPECT_TRUE(status_or.IsOk()) << status_or.GetStatus().ToString();
        return std::move(status_or).Value();
    }

    std::shared_ptr<txbind::storage::MemoryResourcePool> pool_;
    std::unique_ptr<ResourceTransactionManager> manager_;
    TransactionContext context_;
};

// 隔离级别 READ_COMMITTED + 自动提交, 请求 SERIALIZABLE, 提交后全部恢复
TEST_F(TransactionManagerTest, ScenarioARestoresIsolationAndAutoCommitOnCommit) {
    auto tx = Begin(testutils::Definition(isolation::kSerializable));
    ASSERT_TRUE(tx.IsNewTransaction());

    ASSERT_TRUE(tx.Binding()->GetPreviousIsolationLevel().has_value());
    EXPECT_EQ(*tx.Binding()->GetPreviousIsolationLevel(), isolation::kReadCommitted);
    EXPECT_TRUE(tx.Binding()->GetMustRestoreAutoCommit());
    EXPECT_EQ(Connection().isolation_level, isolation::kSerializable);
    EXPECT_FALSE(Connection().auto_commit);
    EXPECT_TRUE(context_.HasResource(manager_->Key()));

    auto status = manager_->Commit(context_, tx);
    ASSERT_TRUE(status.IsOk()) << status.ToString();

    EXPECT_EQ(Connection().commits, 1);
    EXPECT_TRUE(Connection().auto_commit);
    EXPECT_EQ(Connection().auto_commit_enables, 1);
    EXPECT_EQ(Connection().isolation_level, isolation::kReadCommitted);
    EXPECT_EQ(Connection().isolation_changes, 2);
    EXPECT_FALSE(context_.HasResource(manager_->Key()));
    EXPECT_EQ(pool_->IdleCount(), 1u);
}

TEST_F(TransactionManagerTest, ScenarioARestoresOnRollbackToo) {
    auto tx = Begin(testutils::Definition(isolation::kSerializable));
    auto status = manager_->Rollback(context_, tx);
    ASSERT_TRUE(status.IsOk()) << status.ToString();

    EXPECT_EQ(Connection().rollbacks, 1);
    EXPECT_EQ(Connection().commits, 0);
    EXPECT_TRUE(Connection().auto_commit);
    EXPECT_EQ(Connection().isolation_level, isolation::kReadCommitted);
    EXPECT_EQ(pool_->IdleCount(), 1u);
}

// 资源已处于外部事务中(自动提交关闭), 不接管自动提交
TEST_F(TransactionManagerTest, ScenarioBLeavesDisabledAutoCommitAlone) {
    Build(isolation::kReadCommitted, false);
    auto tx = Begin(testutils::Definition());
    EXPECT_FALSE(tx.Binding()->GetMustRestoreAutoCommit());
    EXPECT_FALSE(tx.Binding()->GetPreviousIsolationLevel().has_value());

    ASSERT_TRUE(manager_->Commit(context_, tx).IsOk());
    EXPECT_EQ(Connection().auto_commit_enables, 0);
    EXPECT_EQ(Connection().auto_commit_disables, 0);
    EXPECT_FALSE(Connection().auto_commit);
    EXPECT_EQ(Connection().isolation_changes, 0);
}

// 提交失败且隔离级别恢复也失败, 两个错误都要报告
TEST_F(TransactionManagerTest, ScenarioCReportsCommitAndRestorationFailures) {
    auto tx = Begin(testutils::Definition(isolation::kSerializable));
    Connection().fail_next_commit = true;
    Connection().fail_isolation_changes = true;

    auto status = manager_->Commit(context_, tx);
    ASSERT_FALSE(status.IsOk());
    EXPECT_EQ(status.Code(), StatusCode::kInternal);
    EXPECT_TRUE(testutils::IsErrorKind(status, "CommitFailed")) << status.ToString();
    ASSERT_EQ(status.Suppressed().size(), 1u);
    EXPECT_TRUE(testutils::IsErrorKind(status.Suppressed()[0], "RestorationError")) << status.ToString();

    // 自动提交仍被恢复, 资源在尝试恢复后归还
    EXPECT_TRUE(Connection().auto_commit);
    EXPECT_EQ(Connection().isolation_level, isolation::kSerializable);
    EXPECT_TRUE(tx.IsCompleted());
    EXPECT_FALSE(context_.HasResource(manager_->Key()));
    EXPECT_EQ(pool_->IdleCount(), 1u);
}

TEST_F(TransactionManagerTest, RestorationFailureAloneBecomesPrimary) {
    auto tx = Begin(testutils::Definition(isolation::kSerializable));
    Connection().fail_isolation_changes = true;

    auto status = manager_->Commit(context_, tx);
    EXPECT_EQ(status.Code(), StatusCode::kInternal);
    EXPECT_TRUE(testutils::IsErrorKind(status, "RestorationError")) << status.ToString();
    EXPECT_FALSE(status.HasSuppressed());
    EXPECT_EQ(Connection().commits, 1);
    EXPECT_EQ(pool_->IdleCount(), 1u);
}

TEST_F(TransactionManagerTest, ClosedResourceReportsEveryFailure) {
    auto tx = Begin(testutils::Definition(isolation::kSerializable));
    Connection().closed = true;

    auto status = manager_->Commit(context_, tx);
    ASSERT_FALSE(status.IsOk());
    EXPECT_TRUE(testutils::IsErrorKind(status, "CommitFailed"));
    // 自动提交和隔离级别两项恢复都尝试并报告
    ASSERT_EQ(status.Suppressed().size(), 1u);
    const auto& restoration = status.Suppressed()[0];
    EXPECT_TRUE(testutils::IsErrorKind(restoration, "RestorationError"));
    ASSERT_EQ(restoration.Suppressed().size(), 1u);
    EXPECT_TRUE(testutils::IsErrorKind(restoration.Suppressed()[0], "RestorationError"));
}

TEST_F(TransactionManagerTest, UnchangedIsolationIsNeverTouched) {
    auto tx = Begin(testutils::Definition(isolation::kReadCommitted));
    EXPECT_FALSE(tx.Binding()->GetPreviousIsolationLevel().has_value());
    ASSERT_TRUE(manager_->Commit(context_, tx).IsOk());
    EXPECT_EQ(Connection().isolation_changes, 0);
}

TEST_F(TransactionManagerTest, UnsupportedIsolationIsConfigurationError) {
    Connection().unsupported_isolation_levels.insert(isolation::kSerializable);
    auto status_or = manager_->GetTransaction(context_, testutils::Definition(isolation::kSerializable));
    ASSERT_FALSE(status_or.IsOk());
    EXPECT_EQ(status_or.GetStatus().Code(), StatusCode::kInvalidArgument);
    EXPECT_TRUE(testutils::IsErrorKind(status_or.GetStatus(), "ConfigurationError"));

    // 事务没有开始, 资源未被修改并已归还
    EXPECT_FALSE(context_.HasResource(manager_->Key()));
    EXPECT_EQ(pool_->IdleCount(), 1u);
    EXPECT_TRUE(Connection().auto_commit);
    EXPECT_EQ(Connection().auto_commit_disables, 0);
    EXPECT_EQ(Connection().isolation_changes, 0);
}

TEST_F(TransactionManagerTest, AutoCommitFailureAtBeginUndoesIsolationChange) {
    Connection().fail_auto_commit_changes = true;
    auto status_or = manager_->GetTransaction(context_, testutils::Definition(isolation::kSerializable));
    ASSERT_FALSE(status_or.IsOk());
    EXPECT_EQ(status_or.GetStatus().Code(), StatusCode::kUnavailable);
    EXPECT_EQ(Connection().isolation_level, isolation::kReadCommitted);
    EXPECT_EQ(pool_->IdleCount(), 1u);
}

TEST_F(TransactionManagerTest, ExhaustedPoolCannotCreateTransaction) {
    auto tx = Begin(testutils::Definition());
    TransactionContext other_context;
    auto status_or = manager_->GetTransaction(other_context, testutils::Definition());
    ASSERT_FALSE(status_or.IsOk());
    EXPECT_TRUE(testutils::IsErrorKind(status_or.GetStatus(), "CannotCreateTransaction"));
    ASSERT_TRUE(manager_->Commit(context_, tx).IsOk());
}

TEST_F(TransactionManagerTest, SecondCompletionIsProtocolViolationAndNoOp) {
    auto tx = Begin(testutils::Definition(isolation::kSerializable));
    ASSERT_TRUE(manager_->Commit(context_, tx).IsOk());

    auto again = manager_->Commit(context_, tx);
    EXPECT_EQ(again.Code(), StatusCode::kFailedPrecondition);
    auto rollback = manager_->Rollback(context_, tx);
    EXPECT_EQ(rollback.Code(), StatusCode::kFailedPrecondition);

    EXPECT_EQ(Connection().commits, 1);
    EXPECT_EQ(Connection().rollbacks, 0);
    EXPECT_EQ(Connection().auto_commit_enables, 1);
    EXPECT_EQ(Connection().isolation_changes, 2);
}

TEST_F(TransactionManagerTest, LocalRollbackOnlyTurnsCommitIntoRollback) {
    auto tx = Begin(testutils::Definition());
    tx.SetRollbackOnly();
    auto status = manager_->Commit(context_, tx);
    EXPECT_TRUE(status.IsOk()) << status.ToString();
    EXPECT_EQ(Connection().commits, 0);
    EXPECT_EQ(Connection().rollbacks, 1);
    EXPECT_TRUE(Connection().auto_commit);
}

TEST_F(TransactionManagerTest, ExpiredDeadlineRollsBackThroughCompletionPath) {
    auto definition = testutils::Definition(isolation::kSerializable);
    definition.timeout_seconds = 0;
    auto tx = Begin(definition);

    auto status = manager_->Commit(context_, tx);
    EXPECT_EQ(status.Code(), StatusCode::kDeadlineExceeded);
    EXPECT_EQ(Connection().commits, 0);
    EXPECT_EQ(Connection().rollbacks, 1);
    EXPECT_TRUE(Connection().auto_commit);
    EXPECT_EQ(Connection().isolation_level, isolation::kReadCommitted);
    EXPECT_EQ(pool_->IdleCount(), 1u);
}

TEST_F(TransactionManagerTest, InvalidTimeoutIsRejected) {
    auto definition = testutils::Definition();
    definition.timeout_seconds = -2;
    auto status_or = manager_->GetTransaction(context_, definition);
    ASSERT_FALSE(status_or.IsOk());
    EXPECT_TRUE(testutils::IsErrorKind(status_or.GetStatus(), "InvalidTimeout"));
    EXPECT_EQ(Connection().leases, 0);
}

TEST_F(TransactionManagerTest, MandatoryWithoutTransactionFails) {
    auto status_or = manager_->GetTransaction(context_,
                                              testutils::Definition(isolation::kDefault, Propagation::kMandatory));
    ASSERT_FALSE(status_or.IsOk());
    EXPECT_EQ(status_or.GetStatus().Code(), StatusCode::kFailedPrecondition);
    EXPECT_TRUE(testutils::IsErrorKind(status_or.GetStatus(), "NoTransaction"));
}

TEST_F(TransactionManagerTest, SupportsWithoutTransactionRunsEmpty) {
    auto tx = Begin(testutils::Definition(isolation::kDefault, Propagation::kSupports));
    EXPECT_FALSE(tx.HasTransaction());
    EXPECT_FALSE(tx.IsNewTransaction());
    EXPECT_TRUE(tx.IsNewSynchronization());
    EXPECT_EQ(Connection().leases, 0);

    EXPECT_TRUE(manager_->Rollback(context_, tx).IsOk());
    EXPECT_FALSE(context_.IsSynchronizationActive());
}

TEST_F(TransactionManagerTest, CommitFailureRollsBackWhenConfigured) {
    TransactionManagerConfig config;
    config.rollback_on_commit_failure = true;
    Build(isolation::kReadCommitted, true, config);

    auto tx = Begin(testutils::Definition());
    Connection().fail_next_commit = true;
    auto status = manager_->Commit(context_, tx);
    EXPECT_TRUE(testutils::IsErrorKind(status, "CommitFailed"));
    EXPECT_FALSE(status.HasSuppressed());
    EXPECT_EQ(Connection().rollbacks, 1);
    EXPECT_TRUE(Connection().auto_commit);
}

TEST_F(TransactionManagerTest, ReadOnlyIsAppliedAndResetWhenEnforced) {
    TransactionManagerConfig config;
    config.enforce_read_only = true;
    Build(isolation::kReadCommitted, true, config);

    auto definition = testutils::Definition();
    definition.read_only = true;
    auto tx = Begin(definition);
    EXPECT_TRUE(Connection().read_only);
    ASSERT_TRUE(manager_->Commit(context_, tx).IsOk());
    EXPECT_FALSE(Connection().read_only);
}

TEST_F(TransactionManagerTest, DefaultIsolationFromConfigIsApplied) {
    TransactionManagerConfig config;
    config.default_isolation = isolation::kRepeatableRead;
    Build(isolation::kReadCommitted, true, config);

    auto tx = Begin(testutils::Definition());
    EXPECT_EQ(Connection().isolation_level, isolation::kRepeatableRead);
    ASSERT_TRUE(manager_->Commit(context_, tx).IsOk());
    EXPECT_EQ(Connection().isolation_level, isolation::kReadCommitted);
}

TEST_F(TransactionManagerTest, PendingWritesFollowTheOutcome) {
    auto tx = Begin(testutils::Definition());
    auto* resource = static_cast<txbind::storage::MemoryResource*>(tx.Holder()->Resource());
    ASSERT_TRUE(resource->Write("first").IsOk());
    ASSERT_TRUE(manager_->Commit(context_, tx).IsOk());

    auto rolled = Begin(testutils::Definition());
    resource = static_cast<txbind::storage::MemoryResource*>(rolled.Holder()->Resource());
    ASSERT_TRUE(resource->Write("second").IsOk());
    ASSERT_TRUE(manager_->Rollback(context_, rolled).IsOk());

    ASSERT_EQ(Connection().committed_writes.size(), 1u);
    EXPECT_EQ(Connection().committed_writes[0], "first");
    EXPECT_TRUE(Connection().pending_writes.empty());
}

namespace {
class ThrowingIntSynchronization : public TransactionSynchronization {
public:
    void BeforeCommit(bool) override {
        throw 42;
    }
};
} // namespace

// 回调抛出非 std::exception 时按回调失败处理, 事务回滚且设置恢复
TEST_F(TransactionManagerTest, NonStandardCallbackExceptionStillRestores) {
    auto tx = Begin(testutils::Definition(isolation::kSerializable));
    ASSERT_TRUE(context_.RegisterSynchronization(std::make_shared<ThrowingIntSynchronization>()).IsOk());

    txbind::common::Status status;
    EXPECT_NO_THROW(status = manager_->Commit(context_, tx));
    EXPECT_EQ(status.Code(), StatusCode::kInternal);
    EXPECT_NE(status.Message().find("unknown exception"), std::string::npos) << status.ToString();

    EXPECT_EQ(Connection().commits, 0);
    EXPECT_EQ(Connection().rollbacks, 1);
    EXPECT_EQ(Connection().isolation_level, isolation::kReadCommitted);
    EXPECT_TRUE(Connection().auto_commit);
    EXPECT_FALSE(context_.HasResource(manager_->Key()));
    EXPECT_FALSE(context_.IsSynchronizationActive());
    EXPECT_EQ(pool_->IdleCount(), 1u);
}

// 资源在提交时抛出异常: 异常传给调用方, 但回滚, 恢复和释放都已完成
TEST_F(TransactionManagerTest, ThrowingCommitStillRestoresAndReleases) {
    auto tx = Begin(testutils::Definition(isolation::kSerializable));
    Connection().throw_on_commit = true;

    EXPECT_THROW(manager_->Commit(context_, tx), std::runtime_error);

    EXPECT_TRUE(tx.IsCompleted());
    EXPECT_EQ(Connection().rollbacks, 1);
    EXPECT_EQ(Connection().isolation_level, isolation::kReadCommitted);
    EXPECT_TRUE(Connection().auto_commit);
    EXPECT_FALSE(context_.HasResource(manager_->Key()));
    EXPECT_EQ(pool_->IdleCount(), 1u);

    // 之后的事务新建而不是加入已失效的事务
    Connection().throw_on_commit = false;
    auto next = Begin(testutils::Definition());
    EXPECT_TRUE(next.IsNewTransaction());
    ASSERT_TRUE(manager_->Commit(context_, next).IsOk());
}
