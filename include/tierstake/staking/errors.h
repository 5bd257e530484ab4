// TIERSTAKE - Staking Errors
// Copyright (c) 2024 TIERSTAKE Developers
// MIT License
//
// Closed set of failure kinds reported by the staking engine, plus the
// status structs returned by guards and user operations.

#ifndef TIERSTAKE_STAKING_ERRORS_H
#define TIERSTAKE_STAKING_ERRORS_H

#include <tierstake/core/types.h>

#include <string>

namespace tierstake {
namespace staking {

// ============================================================================
// Error Kinds
// ============================================================================

enum class StakeError {
    /// No error
    None,

    /// Caller is not the owner (admin operations)
    NotOwner,

    /// Caller is not whitelisted (user operations)
    NotApproved,

    /// Tier id is zero or the tier was never configured
    InvalidTier,

    /// Deposit of zero units
    ZeroAmount,

    /// Deposit attempted before the cooldown elapsed
    CooldownActive,

    /// Claim on an empty record
    NoActiveStake,

    /// Principal already claimed once (any tier)
    StakeAlreadyClaimed,

    /// Claim attempted at or before the unlock time
    StakeStillLocked,

    /// Unlock time of a deposit would not fit in a Timestamp
    TimestampOverflow,

    /// Asset transfer collaborator reported failure
    TransferFailed
};

/// Convert error to string
const char* StakeErrorToString(StakeError error);

// ============================================================================
// Status Results
// ============================================================================

/**
 * Outcome of a guard check or an administrative operation.
 */
struct StakeResult {
    StakeError error{StakeError::None};
    std::string message;

    /// For CooldownActive and StakeStillLocked: earliest time the operation
    /// could succeed. Zero otherwise.
    Timestamp availableAt{0};

    bool IsOk() const { return error == StakeError::None; }
    explicit operator bool() const { return IsOk(); }

    /// "ok" or "<Kind>: <message>"
    std::string ToString() const;

    static StakeResult Success() {
        return {};
    }

    static StakeResult Failure(StakeError error, const std::string& msg,
                               Timestamp availableAt = 0) {
        return {error, msg, availableAt};
    }
};

/// Result of a deposit
struct DepositResult {
    StakeResult status;

    Amount amount{0};
    Amount reward{0};

    /// Record state after the deposit
    Amount stakedAmount{0};
    Amount accruedReward{0};
    Timestamp unlockTimestamp{0};

    bool IsOk() const { return status.IsOk(); }
};

/// Result of a claim
struct ClaimResult {
    StakeResult status;

    /// Principal plus accrued reward paid out
    Amount payout{0};

    bool IsOk() const { return status.IsOk(); }
};

} // namespace staking
} // namespace tierstake

#endif // TIERSTAKE_STAKING_ERRORS_H
