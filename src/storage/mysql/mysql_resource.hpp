#pragma once

#include "core/transaction/resource.hpp"
#include "storage/mysql/connection_pool.hpp"

#include <memory>
#include <string>

namespace txbind {
namespace storage {

// 基于连接池租约的 MySQL 事务资源, 析构时连接归还连接池
class MySqlResource : public core::TransactionalResource {
public:
    explicit MySqlResource(ConnectionPool::Lease lease);

    common::StatusOr<int> GetIsolationLevel() override;
    common::Status SetIsolationLevel(int level) override;
    common::StatusOr<bool> GetAutoCommit() override;
    common::Status SetAutoCommit(bool enabled) override;
    common::Status Commit() override;
    common::Status Rollback() override;
    common::Status SetReadOnly(bool read_only) override;
    std::string Describe() const override;

    // 在当前连接上执行语句
    common::Status Execute(const std::string& sql);

    MYSQL* Raw() const noexcept { return lease_.Raw(); }

private:
    ConnectionPool::Lease lease_;
};

// 以连接池为资源来源
class MySqlResourceFactory : public core::ResourceFactory {
public:
    explicit MySqlResourceFactory(std::shared_ptr<ConnectionPool> pool);

    common::StatusOr<std::unique_ptr<core::TransactionalResource>> Acquire() override;

    ConnectionPool& Pool() noexcept { return *pool_; }

private:
    std::shared_ptr<ConnectionPool> pool_;
};

// MySQL 会话变量取值, 如 "READ-COMMITTED"
std::string MySqlIsolationName(int level);

}
}
