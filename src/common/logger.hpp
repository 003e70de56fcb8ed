#pragma once

#include "common/config.hpp"

#include <spdlog/logger.h>
#include <memory>

namespace txbind {
namespace common {

void InitLogger(const LoggingConfig& config);
void ShutdownLogger();

// 获取全局日志器, 未初始化时退回 spdlog 默认日志器
std::shared_ptr<spdlog::logger> GetLogger();

// 日志宏定义
#define TXBIND_LOG_DEBUG(...) ::txbind::common::GetLogger()->debug(__VA_ARGS__)
#define TXBIND_LOG_INFO(...)  ::txbind::common::GetLogger()->info(__VA_ARGS__)
#define TXBIND_LOG_WARN(...)  ::txbind::common::GetLogger()->warn(__VA_ARGS__)
#define TXBIND_LOG_ERROR(...) ::txbind::common::GetLogger()->error(__VA_ARGS__)

}
}
