#pragma once

#include <optional>
#include <string>

namespace txbind {
namespace core {

// 隔离级别取整数值, 与常见驱动约定一致
namespace isolation {
constexpr int kDefault = -1;        // 沿用资源当前的隔离级别
constexpr int kNone = 0;
constexpr int kReadUncommitted = 1;
constexpr int kReadCommitted = 2;
constexpr int kRepeatableRead = 4;
constexpr int kSerializable = 8;
} // namespace isolation

bool IsValidIsolationLevel(int level);

// kDefault 输出 "DEFAULT", 非法值输出 "UNKNOWN(<n>)"
std::string IsolationLevelToString(int level);

// 接受 READ_COMMITTED / read-committed / "read committed" 等写法, 大小写不敏感
std::optional<int> IsolationLevelFromString(const std::string& name);

}
}
