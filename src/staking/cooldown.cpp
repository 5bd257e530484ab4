// TIERSTAKE - Deposit Cooldown Implementation
// Copyright (c) 2024 TIERSTAKE Developers
// MIT License

#include "tierstake/staking/cooldown.h"
#include "tierstake/util/time.h"

namespace tierstake {
namespace staking {

StakeResult CooldownGuard::Check(const Address& principal, Timestamp now) const {
    auto it = lastDeposit_.find(principal);
    if (it == lastDeposit_.end()) {
        return StakeResult::Success();
    }

    Timestamp readyAt = util::SaturatingAddTime(it->second, period_);
    if (now < readyAt) {
        return StakeResult::Failure(
            StakeError::CooldownActive,
            "next deposit allowed at " + util::FormatISO8601(readyAt),
            readyAt);
    }
    return StakeResult::Success();
}

std::optional<Timestamp> CooldownGuard::GetLastDepositTime(const Address& principal) const {
    auto it = lastDeposit_.find(principal);
    if (it == lastDeposit_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace staking
} // namespace tierstake
