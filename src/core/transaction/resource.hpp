#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"

#include <memory>
#include <string>

namespace txbind {
namespace core {

// 可被事务管理器托管的连接类资源
// 只要求能读写隔离级别和自动提交, 以及提交/回滚
// 析构即归还给所属的连接池
class TransactionalResource {
public:
    virtual ~TransactionalResource() = default;

    virtual common::StatusOr<int> GetIsolationLevel() = 0;
    virtual common::Status SetIsolationLevel(int level) = 0;

    virtual common::StatusOr<bool> GetAutoCommit() = 0;
    virtual common::Status SetAutoCommit(bool enabled) = 0;

    virtual common::Status Commit() = 0;
    virtual common::Status Rollback() = 0;

    virtual common::Status SetReadOnly(bool read_only) = 0;

    // 用于日志输出
    virtual std::string Describe() const = 0;
};

// 资源来源(连接池)
class ResourceFactory {
public:
    virtual ~ResourceFactory() = default;
    virtual common::StatusOr<std::unique_ptr<TransactionalResource>> Acquire() = 0;
};

}
}
