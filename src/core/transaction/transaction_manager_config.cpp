#include "core/transaction/transaction_manager_config.hpp"

#include "common/logger.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace txbind {
namespace core {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

SynchronizationMode ParseSynchronization(const std::string& value, SynchronizationMode fallback) {
    const std::string normalized = ToLower(value);
    if (normalized == "always") {
        return SynchronizationMode::kAlways;
    }
    if (normalized == "on_actual_transaction") {
        return SynchronizationMode::kOnActualTransaction;
    }
    if (normalized == "never") {
        return SynchronizationMode::kNever;
    }
    TXBIND_LOG_WARN("Unknown transaction.synchronization \"{}\", using default", value);
    return fallback;
}

NestedIsolationPolicy ParseNestedPolicy(const std::string& value, NestedIsolationPolicy fallback) {
    const std::string normalized = ToLower(value);
    if (normalized == "reject") {
        return NestedIsolationPolicy::kReject;
    }
    if (normalized == "ignore") {
        return NestedIsolationPolicy::kIgnore;
    }
    TXBIND_LOG_WARN("Unknown transaction.nested_isolation_policy \"{}\", using default", value);
    return fallback;
}

} // namespace

TransactionManagerConfig MakeManagerConfig(const common::TransactionConfig& config) {
    TransactionManagerConfig result;
    result.synchronization = ParseSynchronization(config.synchronization, result.synchronization);
    result.nested_isolation_policy = ParseNestedPolicy(config.nested_isolation_policy, result.nested_isolation_policy);
    result.rollback_on_commit_failure = config.rollback_on_commit_failure;
    result.enforce_read_only = config.enforce_read_only;

    if (config.default_timeout_seconds < kTimeoutDefault) {
        TXBIND_LOG_WARN("Invalid transaction.default_timeout_seconds {}, using default",
                        config.default_timeout_seconds);
    } else {
        result.default_timeout_seconds = config.default_timeout_seconds;
    }

    auto level = IsolationLevelFromString(config.default_isolation);
    if (!level) {
        TXBIND_LOG_WARN("Unknown transaction.default_isolation \"{}\", using default", config.default_isolation);
    } else {
        result.default_isolation = *level;
    }
    return result;
}

}
}
