#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "storage/mysql/connection.hpp"

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <queue>

namespace txbind {
namespace storage {

class ConnectionPool {
public:
    explicit ConnectionPool(Options options);

    // 连接租赁类, RAII管理连接的获取和归还
    class Lease {
    public:
        Lease() = default;
        Lease(ConnectionPool* pool, std::unique_ptr<Connection> connection);
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        ~Lease();

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        Connection* operator->() noexcept { return connection_.get(); }
        Connection& operator*() noexcept { return *connection_; }
        const Connection* Get() const noexcept { return connection_.get(); }
        MYSQL* Raw() const noexcept { return connection_ ? connection_->Raw() : nullptr; }
        explicit operator bool() const noexcept { return connection_ != nullptr; }
    private:
        void ReturnToPool() noexcept;

        ConnectionPool* pool_ = nullptr;
        std::unique_ptr<Connection> connection_;
    };

    // 获取连接租赁对象, 连接数已满时等待归还直到超时
    common::StatusOr<Lease> Acquire();

    std::size_t TotalConnections() const;
    std::size_t IdleConnections() const;

private:
    // 归还连接到连接池, 失效连接直接丢弃
    void Return(std::unique_ptr<Connection> connection);

    Options options_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::unique_ptr<Connection>> connections_; // 空闲连接队列
    std::size_t total_connections_ = 0; // 总连接数
};

}// namespace storage
} // namespace txbind
