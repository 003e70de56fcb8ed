#include "core/transaction/isolation_level.hpp"

#include <algorithm>
#include <cctype>

namespace txbind {
namespace core {

namespace {

std::string Normalize(const std::string& name) {
    std::string normalized;
    normalized.reserve(name.size());
    for (unsigned char c : name) {
        if (c == '-' || c == ' ') {
            normalized.push_back('_');
        } else {
            normalized.push_back(static_cast<char>(std::toupper(c)));
        }
    }
    return normalized;
}

} // namespace

bool IsValidIsolationLevel(int level) {
    switch (level) {
        case isolation::kDefault:
        case isolation::kNone:
        case isolation::kReadUncommitted:
        case isolation::kReadCommitted:
        case isolation::kRepeatableRead:
        case isolation::kSerializable:
            return true;
        default:
            return false;
    }
}

std::string IsolationLevelToString(int level) {
    switch (level) {
        case isolation::kDefault:
            return "DEFAULT";
        case isolation::kNone:
            return "NONE";
        case isolation::kReadUncommitted:
            return "READ_UNCOMMITTED";
        case isolation::kReadCommitted:
            return "READ_COMMITTED";
        case isolation::kRepeatableRead:
            return "REPEATABLE_READ";
        case isolation::kSerializable:
            return "SERIALIZABLE";
        default:
            return "UNKNOWN(" + std::to_string(level) + ")";
    }
}

std::optional<int> IsolationLevelFromString(const std::string& name) {
    const std::string normalized = Normalize(name);
    if (normalized == "DEFAULT") {
        return isolation::kDefault;
    }
    if (normalized == "NONE") {
        return isolation::kNone;
    }
    if (normalized == "READ_UNCOMMITTED") {
        return isolation::kReadUncommitted;
    }
    if (normalized == "READ_COMMITTED") {
        return isolation::kReadCommitted;
    }
    if (normalized == "REPEATABLE_READ") {
        return isolation::kRepeatableRead;
    }
    if (normalized == "SERIALIZABLE") {
        return isolation::kSerializable;
    }
    return std::nullopt;
}

}
}
