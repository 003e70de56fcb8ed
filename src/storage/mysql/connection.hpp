#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "storage/mysql/options.hpp"

#include <mysql/mysql.h>
#include <memory>
#include <string>

namespace txbind {
namespace storage {

// 一条 MySQL 物理连接, 析构时关闭
class Connection {
public:
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    ~Connection();

    static common::StatusOr<std::unique_ptr<Connection>> Create(const Options& options);

    // 执行不返回结果集的语句
    common::Status Execute(const std::string& sql);
    // 执行查询并返回第一行第一列, NULL 返回空字符串
    common::StatusOr<std::string> QueryScalar(const std::string& sql);

    bool Ping() noexcept;
    unsigned long ThreadId() const noexcept { return mysql_thread_id(handle_); }

    MYSQL* Raw() const noexcept {return handle_;}
    const Options& GetOptions() const noexcept {return options_;}
private:
    Connection(MYSQL* handle, Options options);

    MYSQL* handle_ = nullptr;
    Options options_;
};

// 创建错误状态, 包含 MySQL 错误信息
common::Status MakeMySqlError(const std::string& context, MYSQL* handle);

}
}
