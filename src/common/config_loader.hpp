#pragma once

#include "common/config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace txbind {
namespace common {

class ConfigLoader {
public:
    // 从文件加载配置, 文件无法打开或解析失败时抛出异常
    static AppConfig Load(const std::string& path);
    // 优先使用 TXBIND_CONFIG 环境变量, 否则使用内置的示例配置
    static AppConfig LoadFromEnvOrDefault();
    static AppConfig FromJson(const nlohmann::json& j);
private:
    static nlohmann::json ReadFile(const std::string& path);
};

// 获取全局配置单例
const AppConfig& GlobalConfig();

}
}
