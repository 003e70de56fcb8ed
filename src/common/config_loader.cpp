#include "common/config_loader.hpp"

#include "config_path.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace txbind {
namespace common {

namespace {
AppConfig g_config;
bool g_config_initialized = false; // 全局配置初始化标志

// 检测配置文件路径
std::string DetectConfigPath() {
    if (const char* env = std::getenv("TXBIND_CONFIG")) {
        return env;
    }
    return GetConfigPath("app.example.json");
}

} // namespace

AppConfig ConfigLoader::Load(const std::string& path) {
    auto json = ReadFile(path);
    return FromJson(json);
}

AppConfig ConfigLoader::LoadFromEnvOrDefault() {
    return Load(DetectConfigPath());
}

const AppConfig& GlobalConfig() {
    if (!g_config_initialized) {
        g_config = ConfigLoader::LoadFromEnvOrDefault();
        g_config_initialized = true;
    }
    return g_config;
}

nlohmann::json ConfigLoader::ReadFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }
    // 允许注释
    return nlohmann::json::parse(ifs, nullptr, true, true);
}

// 从JSON对象构建配置结构体, 缺失字段保持默认值
AppConfig ConfigLoader::FromJson(const nlohmann::json& j) {
    AppConfig cfg;
    // Logging配置
    if (j.contains("logging")) {
        const auto& logging = j["logging"];
        cfg.logging.level = logging.value("level", cfg.logging.level);
        cfg.logging.pattern = logging.value("pattern", cfg.logging.pattern);
        cfg.logging.console = logging.value("console", cfg.logging.console);
        cfg.logging.file = logging.value("file", cfg.logging.file);
    }
    // Transaction配置
    if (j.contains("transaction")) {
        const auto& tx = j["transaction"];
        cfg.transaction.synchronization = tx.value("synchronization", cfg.transaction.synchronization);
        cfg.transaction.nested_isolation_policy =
            tx.value("nested_isolation_policy", cfg.transaction.nested_isolation_policy);
        cfg.transaction.rollback_on_commit_failure =
            tx.value("rollback_on_commit_failure", cfg.transaction.rollback_on_commit_failure);
        cfg.transaction.enforce_read_only = tx.value("enforce_read_only", cfg.transaction.enforce_read_only);
        cfg.transaction.default_timeout_seconds =
            tx.value("default_timeout_seconds", cfg.transaction.default_timeout_seconds);
        cfg.transaction.default_isolation = tx.value("default_isolation", cfg.transaction.default_isolation);
    }
    // Storage配置
    if (j.contains("storage")) {
        const auto& storage = j["storage"];
        if (storage.contains("memory")) {
            const auto& memory = storage["memory"];
            cfg.storage.memory.pool_size = memory.value("pool_size", cfg.storage.memory.pool_size);
            cfg.storage.memory.initial_isolation =
                memory.value("initial_isolation", cfg.storage.memory.initial_isolation);
            cfg.storage.memory.initial_auto_commit =
                memory.value("initial_auto_commit", cfg.storage.memory.initial_auto_commit);
        }
        if (storage.contains("mysql")) {
            const auto& mysql = storage["mysql"];
            cfg.storage.mysql.host = mysql.value("host", cfg.storage.mysql.host);
            cfg.storage.mysql.port = mysql.value("port", cfg.storage.mysql.port);
            cfg.storage.mysql.user = mysql.value("user", cfg.storage.mysql.user);
            cfg.storage.mysql.password = mysql.value("password", cfg.storage.mysql.password);
            cfg.storage.mysql.database = mysql.value("database", cfg.storage.mysql.database);
            cfg.storage.mysql.pool_size = mysql.value("pool_size", cfg.storage.mysql.pool_size);
            cfg.storage.mysql.connection_timeout_ms =
                mysql.value("connection_timeout_ms", cfg.storage.mysql.connection_timeout_ms);
            cfg.storage.mysql.read_timeout_ms = mysql.value("read_timeout_ms", cfg.storage.mysql.read_timeout_ms);
            cfg.storage.mysql.write_timeout_ms = mysql.value("write_timeout_ms", cfg.storage.mysql.write_timeout_ms);
            cfg.storage.mysql.enabled = mysql.value("enabled", cfg.storage.mysql.enabled);
        }
    }
    return cfg;
}

}
}
