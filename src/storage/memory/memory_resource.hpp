#pragma once

#include "common/config.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/transaction/isolation_level.hpp"
#include "core/transaction/resource.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace txbind {
namespace storage {

// 内存中的"物理连接", 记录设置和每类修改的次数, 支持故障注入
struct MemoryConnection {
    std::size_t id = 0;
    int isolation_level = core::isolation::kReadCommitted;
    bool auto_commit = true;
    bool read_only = false;
    bool closed = false;

    // 修改计数
    int isolation_changes = 0;
    int auto_commit_enables = 0;
    int auto_commit_disables = 0;
    int commits = 0;
    int rollbacks = 0;
    int leases = 0;

    // 故障注入
    bool fail_next_commit = false;
    bool fail_rollback = false;
    bool fail_isolation_changes = false;
    bool fail_auto_commit_changes = false;
    bool throw_on_commit = false; // 提交时抛出异常, 模拟驱动层异常
    std::set<int> unsupported_isolation_levels;

    std::vector<std::string> pending_writes;
    std::vector<std::string> committed_writes;
};

class MemoryResourcePool;

// 租用中的内存连接, 析构时归还连接池
class MemoryResource : public core::TransactionalResource {
public:
    MemoryResource(MemoryResourcePool* pool, MemoryConnection* connection);
    ~MemoryResource() override;

    MemoryResource(const MemoryResource&) = delete;
    MemoryResource& operator=(const MemoryResource&) = delete;

    common::StatusOr<int> GetIsolationLevel() override;
    common::Status SetIsolationLevel(int level) override;
    common::StatusOr<bool> GetAutoCommit() override;
    common::Status SetAutoCommit(bool enabled) override;
    common::Status Commit() override;
    common::Status Rollback() override;
    common::Status SetReadOnly(bool read_only) override;
    std::string Describe() const override;

    // 写入一条记录, 自动提交时直接生效, 否则等待提交
    common::Status Write(const std::string& record);

    MemoryConnection& Connection() noexcept { return *connection_; }

private:
    common::Status CheckOpen() const;

    MemoryResourcePool* pool_ = nullptr;
    MemoryConnection* connection_ = nullptr;
};

class MemoryResourcePool : public core::ResourceFactory {
public:
    struct Options {
        std::size_t pool_size = 4;
        int initial_isolation = core::isolation::kReadCommitted;
        bool initial_auto_commit = true;
        std::chrono::milliseconds acquire_timeout{500};
    };

    explicit MemoryResourcePool(Options options);
    MemoryResourcePool(const MemoryResourcePool&) = delete;
    MemoryResourcePool& operator=(const MemoryResourcePool&) = delete;

    // 获取空闲连接, 全部租出时等待归还或超时
    common::StatusOr<std::unique_ptr<core::TransactionalResource>> Acquire() override;

    // 按编号访问连接, 用于检查状态和注入故障
    MemoryConnection& ConnectionAt(std::size_t index);
    std::size_t Size() const noexcept { return connections_.size(); }
    std::size_t IdleCount() const;
    std::size_t LeasedCount() const;

private:
    friend class MemoryResource;
    void Return(MemoryConnection* connection);

    Options options_;
    std::vector<std::unique_ptr<MemoryConnection>> connections_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<MemoryConnection*> idle_; // 空闲连接队列
};

// 由配置构建连接池参数, 非法取值记录警告并保持默认
MemoryResourcePool::Options MemoryOptionsFromConfig(const common::MemoryStorageConfig& config);

}
}
