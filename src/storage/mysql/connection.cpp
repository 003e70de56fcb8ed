#include "storage/mysql/connection.hpp"

#include <mysql/errmsg.h>

namespace txbind {
namespace storage {

common::Status MakeMySqlError(const std::string& context, MYSQL* handle) {
    std::string message = context;
    if (handle != nullptr) {
        message += ": ";
        message += mysql_error(handle);
        // 连接已断开
        unsigned int err = mysql_errno(handle);
        if (err == CR_SERVER_GONE_ERROR || err == CR_SERVER_LOST) {
            return common::Status::Unavailable(message);
        }
    }
    return common::Status::Internal(message);
}

Connection::Connection(MYSQL* handle, Options options): handle_(handle), options_(std::move(options)) {}

Connection::~Connection() {
    if (handle_ != nullptr) {
        mysql_close(handle_);
        handle_ = nullptr;
    }
}

// 静态工厂方法, 创建并初始化 MySQL 连接
common::StatusOr<std::unique_ptr<Connection>> Connection::Create(const Options& options) {
    MYSQL* handle = mysql_init(nullptr);
    if (handle == nullptr) {
        return MakeMySqlError("mysql_init failed", nullptr);
    }

    // 超时以秒为单位, 不足一秒按一秒处理
    auto to_seconds = [](std::chrono::milliseconds timeout) {
        auto seconds = static_cast<unsigned int>(timeout.count() / 1000);
        return seconds == 0 ? 1u : seconds;
    };
    unsigned int connect_timeout_sec = to_seconds(options.connect_timeout);
    mysql_options(handle, MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout_sec);
    unsigned int read_timeout_sec = to_seconds(options.read_timeout);
    mysql_options(handle, MYSQL_OPT_READ_TIMEOUT, &read_timeout_sec);
    unsigned int write_timeout_sec = to_seconds(options.write_timeout);
    mysql_options(handle, MYSQL_OPT_WRITE_TIMEOUT, &write_timeout_sec);

    if (!mysql_real_connect(handle,
                           options.host.c_str(),
                           options.user.c_str(),
                           options.password.c_str(),
                           options.database.c_str(),
                           options.port,
                           nullptr,
                           0)) {
        common::Status status = MakeMySqlError("mysql_real_connect failed", handle);
        mysql_close(handle);
        return status;
    }

    if (!options.charset.empty() && mysql_set_character_set(handle, options.charset.c_str()) != 0) {
        common::Status status = MakeMySqlError("mysql_set_character_set failed", handle);
        mysql_close(handle);
        return status;
    }

    return common::StatusOr<std::unique_ptr<Connection>>(std::unique_ptr<Connection>(new Connection(handle, options)));
}

common::Status Connection::Execute(const std::string& sql) {
    if (mysql_real_query(handle_, sql.c_str(), sql.size()) != 0) {
        return MakeMySqlError(sql, handle_);
    }
    // 丢弃可能存在的结果集
    MYSQL_RES* res = mysql_store_result(handle_);
    if (res != nullptr) {
        mysql_free_result(res);
    }
    return common::Status::OK();
}

common::StatusOr<std::string> Connection::QueryScalar(const std::string& sql) {
    if (mysql_real_query(handle_, sql.c_str(), sql.size()) != 0) {
        return MakeMySqlError(sql, handle_);
    }
    MYSQL_RES* res = mysql_store_result(handle_);
    if (!res) {
        return MakeMySqlError("no result for " + sql, handle_);
    }
    auto cleanup = std::unique_ptr<MYSQL_RES, decltype(&mysql_free_result)>(res, mysql_free_result);
    MYSQL_ROW row = mysql_fetch_row(res);
    if (!row) {
        return common::Status::NotFound("empty result for " + sql);
    }
    return common::StatusOr<std::string>(std::string(row[0] ? row[0] : ""));
}

bool Connection::Ping() noexcept {
    return mysql_ping(handle_) == 0;
}

}
}
