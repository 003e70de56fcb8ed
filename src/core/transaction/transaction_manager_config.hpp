#pragma once

#include "common/config.hpp"
#include "core/transaction/isolation_level.hpp"
#include "core/transaction/transaction_definition.hpp"

namespace txbind {
namespace core {

// 何时为事务作用域激活完成回调
enum class SynchronizationMode {
    kAlways,               // 包括 SUPPORTS 下的空事务
    kOnActualTransaction,  // 仅实际存在事务时
    kNever,
};

// 参与事务请求了与外层不同的隔离级别时的处理方式
enum class NestedIsolationPolicy {
    kReject,  // 返回 ConfigurationError, 内层事务不开始
    kIgnore,  // 记录警告后沿用外层隔离级别
};

struct TransactionManagerConfig {
    SynchronizationMode synchronization = SynchronizationMode::kAlways;
    NestedIsolationPolicy nested_isolation_policy = NestedIsolationPolicy::kReject;
    bool rollback_on_commit_failure = false;
    bool enforce_read_only = false;
    // 定义中使用默认值时的替代值
    int default_timeout_seconds = kTimeoutDefault;
    int default_isolation = isolation::kDefault;
};

// 从应用配置构建, 无法识别的取值记录警告并使用默认值
TransactionManagerConfig MakeManagerConfig(const common::TransactionConfig& config);

}
}
