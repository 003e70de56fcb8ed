#include "storage/memory/memory_resource.hpp"

#include "common/logger.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace txbind {
namespace storage {

MemoryResource::MemoryResource(MemoryResourcePool* pool, MemoryConnection* connection)
    : pool_(pool), connection_(connection) {}

MemoryResource::~MemoryResource() {
    if (pool_ && connection_) {
        pool_->Return(connection_);
    }
}

common::Status MemoryResource::CheckOpen() const {
    if (connection_->closed) {
        return common::Status::Unavailable(fmt::format("memory connection #{} is closed", connection_->id));
    }
    return common::Status::OK();
}

common::StatusOr<int> MemoryResource::GetIsolationLevel() {
    auto status = CheckOpen();
    if (!status.IsOk()) {
        return status;
    }
    return common::StatusOr<int>(connection_->isolation_level);
}

common::Status MemoryResource::SetIsolationLevel(int level) {
    auto status = CheckOpen();
    if (!status.IsOk()) {
        return status;
    }
    if (connection_->fail_isolation_changes) {
        return common::Status::Internal("injected isolation change failure");
    }
    if (level == core::isolation::kDefault || !core::IsValidIsolationLevel(level) ||
        connection_->unsupported_isolation_levels.count(level) > 0) {
        return common::Status::InvalidArgument("unsupported isolation level " + core::IsolationLevelToString(level));
    }
    connection_->isolation_level = level;
    ++connection_->isolation_changes;
    return common::Status::OK();
}

common::StatusOr<bool> MemoryResource::GetAutoCommit() {
    auto status = CheckOpen();
    if (!status.IsOk()) {
        return status;
    }
    return common::StatusOr<bool>(connection_->auto_commit);
}

common::Status MemoryResource::SetAutoCommit(bool enabled) {
    auto status = CheckOpen();
    if (!status.IsOk()) {
        return status;
    }
    if (connection_->fail_auto_commit_changes) {
        return common::Status::Internal("injected auto-commit change failure");
    }
    // 开启自动提交时隐式提交未完成的写入
    if (enabled && !connection_->auto_commit) {
        std::move(connection_->pending_writes.begin(), connection_->pending_writes.end(),
                  std::back_inserter(connection_->committed_writes));
        connection_->pending_writes.clear();
    }
    connection_->auto_commit = enabled;
    if (enabled) {
        ++connection_->auto_commit_enables;
    } else {
        ++connection_->auto_commit_disables;
    }
    return common::Status::OK();
}

common::Status MemoryResource::Commit() {
    auto status = CheckOpen();
    if (!status.IsOk()) {
        return status;
    }
    if (connection_->throw_on_commit) {
        throw std::runtime_error(fmt::format("memory connection #{} commit threw", connection_->id));
    }
    if (connection_->fail_next_commit) {
        connection_->fail_next_commit = false;
        return common::Status::Internal("injected commit failure");
    }
    std::move(connection_->pending_writes.begin(), connection_->pending_writes.end(),
              std::back_inserter(connection_->committed_writes));
    connection_->pending_writes.clear();
    ++connection_->commits;
    return common::Status::OK();
}

common::Status MemoryResource::Rollback() {
    auto status = CheckOpen();
    if (!status.IsOk()) {
        return status;
    }
    if (connection_->fail_rollback) {
        return common::Status::Internal("injected rollback failure");
    }
    connection_->pending_writes.clear();
    ++connection_->rollbacks;
    return common::Status::OK();
}

common::Status MemoryResource::SetReadOnly(bool read_only) {
    auto status = CheckOpen();
    if (!status.IsOk()) {
        return status;
    }
    connection_->read_only = read_only;
    return common::Status::OK();
}

std::string MemoryResource::Describe() const {
    return fmt::format("memory connection #{}", connection_->id);
}

common::Status MemoryResource::Write(const std::string& record) {
    auto status = CheckOpen();
    if (!status.IsOk()) {
        return status;
    }
    if (connection_->read_only) {
        return common::Status::FailedPrecondition("connection is read-only");
    }
    if (connection_->auto_commit) {
        connection_->committed_writes.push_back(record);
    } else {
        connection_->pending_writes.push_back(record);
    }
    return common::Status::OK();
}

MemoryResourcePool::MemoryResourcePool(Options options) : options_(options) {
    connections_.reserve(options_.pool_size);
    for (std::size_t i = 0; i < options_.pool_size; ++i) {
        auto connection = std::make_unique<MemoryConnection>();
        connection->id = i;
        connection->isolation_level = options_.initial_isolation;
        connection->auto_commit = options_.initial_auto_commit;
        idle_.push_back(connection.get());
        connections_.push_back(std::move(connection));
    }
}

common::StatusOr<std::unique_ptr<core::TransactionalResource>> MemoryResourcePool::Acquire() {
    std::unique_lock lock(mutex_);
    if (!cv_.wait_for(lock, options_.acquire_timeout, [this]() { return !idle_.empty(); })) {
        return common::Status::Unavailable("Acquire memory connection timeout");
    }
    MemoryConnection* connection = idle_.front();
    idle_.pop_front();
    ++connection->leases;
    std::unique_ptr<core::TransactionalResource> resource = std::make_unique<MemoryResource>(this, connection);
    return common::StatusOr<std::unique_ptr<core::TransactionalResource>>(std::move(resource));
}

void MemoryResourcePool::Return(MemoryConnection* connection) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // 最近归还的连接优先借出
        idle_.push_front(connection);
    }
    cv_.notify_one();
}

MemoryConnection& MemoryResourcePool::ConnectionAt(std::size_t index) {
    return *connections_.at(index);
}

std::size_t MemoryResourcePool::IdleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

std::size_t MemoryResourcePool::LeasedCount() const {
    return connections_.size() - IdleCount();
}

MemoryResourcePool::Options MemoryOptionsFromConfig(const common::MemoryStorageConfig& config) {
    MemoryResourcePool::Options options;
    if (config.pool_size <= 0) {
        TXBIND_LOG_WARN("Invalid storage.memory.pool_size {}, using {}", config.pool_size, options.pool_size);
    } else {
        options.pool_size = static_cast<std::size_t>(config.pool_size);
    }
    auto level = core::IsolationLevelFromString(config.initial_isolation);
    if (!level || *level == core::isolation::kDefault) {
        TXBIND_LOG_WARN("Unknown storage.memory.initial_isolation \"{}\", using {}", config.initial_isolation,
                        core::IsolationLevelToString(options.initial_isolation));
    } else {
        options.initial_isolation = *level;
    }
    options.initial_auto_commit = config.initial_auto_commit;
    return options;
}

}
}
