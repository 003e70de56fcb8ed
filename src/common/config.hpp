#pragma once

#include <string>

namespace txbind {
namespace common {

// 日志配置结构体
struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e][%^%l%$][%t] %v";
    bool console = true;
    std::string file = "";
};

// 事务管理器配置结构体, 枚举字段以字符串保存, 由事务模块解析
struct TransactionConfig {
    std::string synchronization = "always";          // always / on_actual_transaction / never
    std::string nested_isolation_policy = "reject";  // reject / ignore
    bool rollback_on_commit_failure = false;
    bool enforce_read_only = false;
    int default_timeout_seconds = -1;
    std::string default_isolation = "DEFAULT";
};

// 内存资源池配置结构体
struct MemoryStorageConfig {
    int pool_size = 4;
    std::string initial_isolation = "READ_COMMITTED";
    bool initial_auto_commit = true;
};

// Mysql配置结构体
struct MysqlConfig {
    std::string host = "127.0.0.1";
    int port = 3306;
    std::string user = "dev";
    std::string password = "";
    std::string database = "txbind";
    int pool_size = 4;
    int connection_timeout_ms = 500;
    int read_timeout_ms = 2000;
    int write_timeout_ms = 2000;
    bool enabled = false;
};

// 存储配置结构体
struct StorageConfig {
    MemoryStorageConfig memory;
    MysqlConfig mysql;
};

// 应用配置结构体
struct AppConfig {
    LoggingConfig logging;
    TransactionConfig transaction;
    StorageConfig storage;
};

}
}
