#include "storage/mysql/connection_pool.hpp"

#include "common/logger.hpp"

namespace txbind {
namespace storage {

ConnectionPool::ConnectionPool(Options options): options_(std::move(options)) {}

ConnectionPool::Lease::Lease(ConnectionPool* pool, std::unique_ptr<Connection> connection)
    : pool_(pool), connection_(std::move(connection)) {}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), connection_(std::move(other.connection_)) {
    other.pool_ = nullptr;
}

ConnectionPool::Lease& ConnectionPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        ReturnToPool();
        pool_ = other.pool_;
        connection_ = std::move(other.connection_);
        other.pool_ = nullptr;
    }
    return *this;
}

ConnectionPool::Lease::~Lease() {
    ReturnToPool();
}

void ConnectionPool::Lease::ReturnToPool() noexcept {
    if (pool_ && connection_) {
        pool_->Return(std::move(connection_));
    }
    pool_ = nullptr;
}

common::StatusOr<ConnectionPool::Lease> ConnectionPool::Acquire() {
    std::unique_ptr<Connection> connection;
    {
        std::unique_lock lock(mutex_);
        if (!connections_.empty()) {
            // 有空闲连接 -> 直接使用
            connection = std::move(connections_.front());
            connections_.pop();
        } else if (total_connections_ < options_.pool_size) {
            // 未达最大连接数 -> 在锁外创建新连接
            ++total_connections_;
            lock.unlock();
            auto created = Connection::Create(options_);
            if (!created.IsOk()) {
                std::lock_guard<std::mutex> guard(mutex_);
                --total_connections_;
                cv_.notify_one();
                return created.GetStatus();
            }
            connection = std::move(created).Value();
        } else {
            // 达到最大连接数 -> 等待归还或超时
            if (!cv_.wait_for(lock, options_.acquire_timeout, [this]() { return !connections_.empty(); })) {
                return common::Status::Unavailable("Acquire connection timeout");
            }
            connection = std::move(connections_.front());
            connections_.pop();
        }
    }
    return common::StatusOr<Lease>(Lease(this, std::move(connection)));
}

void ConnectionPool::Return(std::unique_ptr<Connection> connection) {
    if (!connection->Ping()) {
        TXBIND_LOG_WARN("Dropping dead MySQL connection (thread id {})", connection->ThreadId());
        connection.reset();
        std::lock_guard<std::mutex> lock(mutex_);
        --total_connections_;
        cv_.notify_one();
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connections_.push(std::move(connection));
    }
    cv_.notify_one();
}

std::size_t ConnectionPool::TotalConnections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_connections_;
}

std::size_t ConnectionPool::IdleConnections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

} // namespace storage
} // namespace txbind
