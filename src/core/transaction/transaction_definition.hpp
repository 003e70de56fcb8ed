#pragma once

#include "core/transaction/isolation_level.hpp"

#include <string>

namespace txbind {
namespace core {

// 事务传播行为
enum class Propagation {
    kRequired,   // 加入已有事务, 没有则新建
    kSupports,   // 加入已有事务, 没有则以非事务方式执行
    kMandatory,  // 必须加入已有事务, 没有则报错
};

constexpr int kTimeoutDefault = -1;

// 描述一次事务的请求属性
struct TransactionDefinition {
    Propagation propagation = Propagation::kRequired;
    int isolation_level = isolation::kDefault;
    int timeout_seconds = kTimeoutDefault;
    bool read_only = false;
    std::string name;
};

inline const char* PropagationToString(Propagation propagation) {
    switch (propagation) {
        case Propagation::kRequired:
            return "REQUIRED";
        case Propagation::kSupports:
            return "SUPPORTS";
        case Propagation::kMandatory:
            return "MANDATORY";
    }
    return "UNKNOWN";
}

}
}
