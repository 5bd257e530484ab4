// TIERSTAKE - Deposit Cooldown
// Copyright (c) 2024 TIERSTAKE Developers
// MIT License

#ifndef TIERSTAKE_STAKING_COOLDOWN_H
#define TIERSTAKE_STAKING_COOLDOWN_H

#include <tierstake/core/types.h>
#include <tierstake/staking/errors.h>

#include <map>
#include <optional>

namespace tierstake {
namespace staking {

/// Default minimum interval between deposits (one day)
constexpr Duration DEFAULT_COOLDOWN_PERIOD = SECONDS_PER_DAY;

/**
 * Tracks the last deposit time per principal, shared across all tiers.
 * A principal that never deposited is never in cooldown.
 */
class CooldownGuard {
public:
    using DepositTimes = std::map<Address, Timestamp>;

    explicit CooldownGuard(Duration period = DEFAULT_COOLDOWN_PERIOD)
        : period_(period) {}

    /// CooldownActive if now < lastDeposit + period
    StakeResult Check(const Address& principal, Timestamp now) const;

    /// Record a completed deposit
    void Record(const Address& principal, Timestamp now) {
        lastDeposit_[principal] = now;
    }

    std::optional<Timestamp> GetLastDepositTime(const Address& principal) const;

    Duration GetPeriod() const { return period_; }

    const DepositTimes& GetAll() const { return lastDeposit_; }

    void Restore(const DepositTimes& times) { lastDeposit_ = times; }

private:
    Duration period_;
    DepositTimes lastDeposit_;
};

} // namespace staking
} // namespace tierstake

#endif // TIERSTAKE_STAKING_COOLDOWN_H
