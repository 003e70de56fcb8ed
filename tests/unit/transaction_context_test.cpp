#include "core/transaction/transaction_context.hpp"
#include "test_memory_utils.hpp"

#include <gtest/gtest.h>

using namespace txbind::core;
using txbind::common::StatusCode;

class TransactionContextTest : public ::testing::Test {
protected:
    void SetUp() override {
        pool_ = testutils::MakeMemoryPool(2);
    }

    std::shared_ptr<ResourceHolder> NewHolder() {
        auto resource = pool_->Acquire();
        EXPECT_TRUE(resource.IsOk()) << resource.GetStatus().Message();
        return std::make_shared<ResourceHolder>(std::move(resource).Value());
    }

    std::shared_ptr<txbind::storage::MemoryResourcePool> pool_;
    TransactionContext context_;
};

TEST_F(TransactionContextTest, BindAndUnbindResource) {
    auto holder = NewHolder();
    ASSERT_TRUE(context_.BindResource(pool_.get(), holder).IsOk());
    EXPECT_TRUE(context_.HasResource(pool_.get()));
    EXPECT_EQ(context_.GetResource(pool_.get()), holder);
    EXPECT_EQ(context_.BoundResourceCount(), 1u);

    ASSERT_TRUE(context_.UnbindResource(pool_.get()).IsOk());
    EXPECT_FALSE(context_.HasResource(pool_.get()));
    EXPECT_EQ(context_.GetResource(pool_.get()), nullptr);
}

TEST_F(TransactionContextTest, DoubleBindIsProtocolViolation) {
    ASSERT_TRUE(context_.BindResource(pool_.get(), NewHolder()).IsOk());
    auto status = context_.BindResource(pool_.get(), NewHolder());
    EXPECT_EQ(status.Code(), StatusCode::kFailedPrecondition);
    EXPECT_TRUE(testutils::IsErrorKind(status, "ProtocolViolation"));
    EXPECT_EQ(context_.BoundResourceCount(), 1u);
}

TEST_F(TransactionContextTest, NullBindingIsRejected) {
    EXPECT_TRUE(testutils::IsErrorKind(context_.BindResource(pool_.get(), nullptr), "ProtocolViolation"));
    EXPECT_TRUE(testutils::IsErrorKind(context_.BindResource(nullptr, NewHolder()), "ProtocolViolation"));
}

TEST_F(TransactionContextTest, UnbindWithoutBindingIsProtocolViolation) {
    auto status = context_.UnbindResource(pool_.get());
    EXPECT_TRUE(testutils::IsErrorKind(status, "ProtocolViolation"));
}

TEST_F(TransactionContextTest, SynchronizationLifecycle) {
    auto recorder = std::make_shared<testutils::RecordingSynchronization>();
    EXPECT_TRUE(testutils::IsErrorKind(context_.RegisterSynchronization(recorder), "ProtocolViolation"));

    ASSERT_TRUE(context_.InitSynchronization().IsOk());
    EXPECT_TRUE(context_.IsSynchronizationActive());
    EXPECT_TRUE(testutils::IsErrorKind(context_.InitSynchronization(), "ProtocolViolation"));
    EXPECT_EQ(context_.RegisterSynchronization(nullptr).Code(), StatusCode::kInvalidArgument);

    ASSERT_TRUE(context_.RegisterSynchronization(recorder).IsOk());
    EXPECT_EQ(context_.GetSynchronizations().size(), 1u);

    context_.ClearSynchronization();
    EXPECT_FALSE(context_.IsSynchronizationActive());
    EXPECT_TRUE(context_.GetSynchronizations().empty());
}

class ResourceHolderTest : public TransactionContextTest {};

TEST_F(ResourceHolderTest, ReferenceCounting) {
    auto holder = NewHolder();
    EXPECT_FALSE(holder->IsOpen());
    holder->Requested();
    holder->Requested();
    EXPECT_EQ(holder->ReferenceCount(), 2);
    holder->Released();
    EXPECT_TRUE(holder->IsOpen());
    holder->Released();
    EXPECT_FALSE(holder->IsOpen());
    // 多余的释放不会变为负数
    holder->Released();
    EXPECT_EQ(holder->ReferenceCount(), 0);
}

TEST_F(ResourceHolderTest, DeadlineTracking) {
    auto holder = NewHolder();
    EXPECT_FALSE(holder->HasTimeout());
    EXPECT_FALSE(holder->IsDeadlineExpired());
    EXPECT_FALSE(holder->TimeToLive().has_value());

    const auto start = ResourceHolder::Clock::now();
    holder->SetTimeoutInSeconds(5, start);
    EXPECT_TRUE(holder->HasTimeout());
    EXPECT_FALSE(holder->IsDeadlineExpired(start + std::chrono::seconds(4)));
    EXPECT_TRUE(holder->IsDeadlineExpired(start + std::chrono::seconds(5)));

    auto ttl = holder->TimeToLive(start + std::chrono::seconds(2));
    ASSERT_TRUE(ttl.has_value());
    EXPECT_EQ(ttl->count(), 3000);
    EXPECT_EQ(holder->TimeToLive(start + std::chrono::seconds(9))->count(), 0);
}

TEST_F(ResourceHolderTest, ClearResetsTransactionState) {
    auto holder = NewHolder();
    holder->SetTransactionActive(true);
    holder->SetRollbackOnly();
    holder->SetTimeoutInSeconds(1);
    holder->Clear();
    EXPECT_FALSE(holder->IsTransactionActive());
    EXPECT_FALSE(holder->IsRollbackOnly());
    EXPECT_FALSE(holder->HasTimeout());
    EXPECT_NE(holder->Resource(), nullptr);
}

TEST_F(ResourceHolderTest, DestroyingHolderReturnsResourceToPool) {
    {
        auto holder = NewHolder();
        EXPECT_EQ(pool_->IdleCount(), 1u);
    }
    EXPECT_EQ(pool_->IdleCount(), 2u);
}
