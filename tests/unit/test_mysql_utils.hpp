#pragma once

#include "common/config_loader.hpp"
#include "storage/mysql/connection_pool.hpp"
#include "storage/mysql/options.hpp"

#include <gtest/gtest.h>
#include <mysql/mysql.h>

#include <cstdlib>
#include <memory>
#include <string>

namespace testutils {

// 未设置 TXBIND_DB_HOST 时返回空, 用例自行跳过
// 其余连接参数取自配置文件
inline std::shared_ptr<txbind::storage::ConnectionPool> CreatePoolFromConfig(std::size_t pool_size = 1) {
    const char* host = std::getenv("TXBIND_DB_HOST");
    if (host == nullptr || *host == '\0') {
        return nullptr;
    }
    const auto cfg = txbind::common::ConfigLoader::LoadFromEnvOrDefault();
    auto opts = txbind::storage::OptionsFromConfig(cfg.storage.mysql);
    opts.host = host;
    opts.pool_size = pool_size;
    return std::make_shared<txbind::storage::ConnectionPool>(opts);
}

inline void ExecuteSql(txbind::storage::ConnectionPool& pool, const std::string& sql) {
    auto lease_or = pool.Acquire();
    ASSERT_TRUE(lease_or.IsOk()) << lease_or.GetStatus().Message();
    auto lease = std::move(lease_or.Value());
    MYSQL* conn = lease.Raw();
    ASSERT_EQ(0, mysql_real_query(conn, sql.c_str(), sql.size())) << mysql_error(conn);
}

// 每次用例前重建测试表
inline void ResetMysqlTestTable(txbind::storage::ConnectionPool& pool) {
    ExecuteSql(pool, "CREATE TABLE IF NOT EXISTS txbind_rows (id INT AUTO_INCREMENT PRIMARY KEY, "
                     "value VARCHAR(64) NOT NULL) ENGINE=InnoDB");
    ExecuteSql(pool, "DELETE FROM txbind_rows");
}

} // namespace testutils
