#include "core/transaction/resource_holder.hpp"

#include <algorithm>

namespace txbind {
namespace core {

ResourceHolder::ResourceHolder(std::unique_ptr<TransactionalResource> resource)
    : resource_(std::move(resource)) {}

void ResourceHolder::Released() noexcept {
    if (reference_count_ > 0) {
        --reference_count_;
    }
}

void ResourceHolder::SetTimeoutInSeconds(int seconds, Clock::time_point now) {
    deadline_ = now + std::chrono::seconds(seconds);
}

bool ResourceHolder::IsDeadlineExpired(Clock::time_point now) const noexcept {
    return deadline_.has_value() && now >= *deadline_;
}

std::optional<std::chrono::milliseconds> ResourceHolder::TimeToLive(Clock::time_point now) const {
    if (!deadline_) {
        return std::nullopt;
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - now);
    return std::max(remaining, std::chrono::milliseconds(0));
}

void ResourceHolder::Clear() noexcept {
    transaction_active_ = false;
    rollback_only_ = false;
    deadline_.reset();
}

}
}
