#include "storage/mysql/mysql_resource.hpp"

#include "core/transaction/isolation_level.hpp"

#include <fmt/format.h>

namespace txbind {
namespace storage {

std::string MySqlIsolationName(int level) {
    switch (level) {
        case core::isolation::kReadUncommitted:
            return "READ UNCOMMITTED";
        case core::isolation::kReadCommitted:
            return "READ COMMITTED";
        case core::isolation::kRepeatableRead:
            return "REPEATABLE READ";
        case core::isolation::kSerializable:
            return "SERIALIZABLE";
        default:
            return "";
    }
}

MySqlResource::MySqlResource(ConnectionPool::Lease lease) : lease_(std::move(lease)) {}

common::StatusOr<int> MySqlResource::GetIsolationLevel() {
    // MySQL 8 使用 transaction_isolation, 5.7 之前为 tx_isolation
    auto value = lease_->QueryScalar("SELECT @@SESSION.transaction_isolation");
    if (!value.IsOk()) {
        value = lease_->QueryScalar("SELECT @@SESSION.tx_isolation");
    }
    if (!value.IsOk()) {
        return value.GetStatus();
    }
    auto level = core::IsolationLevelFromString(value.Value());
    if (!level) {
        return common::Status::Internal("unrecognized isolation level '" + value.Value() + "'");
    }
    return common::StatusOr<int>(*level);
}

common::Status MySqlResource::SetIsolationLevel(int level) {
    const std::string name = MySqlIsolationName(level);
    if (name.empty()) {
        return common::Status::InvalidArgument("MySQL does not support isolation level " +
                                               core::IsolationLevelToString(level));
    }
    return lease_->Execute("SET SESSION TRANSACTION ISOLATION LEVEL " + name);
}

common::StatusOr<bool> MySqlResource::GetAutoCommit() {
    auto value = lease_->QueryScalar("SELECT @@SESSION.autocommit");
    if (!value.IsOk()) {
        return value.GetStatus();
    }
    return common::StatusOr<bool>(value.Value() == "1");
}

common::Status MySqlResource::SetAutoCommit(bool enabled) {
    if (mysql_autocommit(lease_.Raw(), enabled ? 1 : 0) != 0) {
        return MakeMySqlError("mysql_autocommit failed", lease_.Raw());
    }
    return common::Status::OK();
}

common::Status MySqlResource::Commit() {
    if (mysql_commit(lease_.Raw()) != 0) {
        return MakeMySqlError("mysql_commit failed", lease_.Raw());
    }
    return common::Status::OK();
}

common::Status MySqlResource::Rollback() {
    if (mysql_rollback(lease_.Raw()) != 0) {
        return MakeMySqlError("mysql_rollback failed", lease_.Raw());
    }
    return common::Status::OK();
}

common::Status MySqlResource::SetReadOnly(bool read_only) {
    return lease_->Execute(read_only ? "SET SESSION TRANSACTION READ ONLY" : "SET SESSION TRANSACTION READ WRITE");
}

std::string MySqlResource::Describe() const {
    const Connection* connection = lease_.Get();
    if (connection == nullptr) {
        return "mysql connection (released)";
    }
    return fmt::format("mysql connection {}@{}:{} (thread {})", connection->GetOptions().user,
                       connection->GetOptions().host, connection->GetOptions().port, connection->ThreadId());
}

common::Status MySqlResource::Execute(const std::string& sql) {
    return lease_->Execute(sql);
}

MySqlResourceFactory::MySqlResourceFactory(std::shared_ptr<ConnectionPool> pool) : pool_(std::move(pool)) {}

common::StatusOr<std::unique_ptr<core::TransactionalResource>> MySqlResourceFactory::Acquire() {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    return common::StatusOr<std::unique_ptr<core::TransactionalResource>>(
        std::unique_ptr<core::TransactionalResource>(new MySqlResource(std::move(lease_or).Value())));
}

}
}
