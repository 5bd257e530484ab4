// TIERSTAKE - Stake Ledger
// Copyright (c) 2024 TIERSTAKE Developers
// MIT License
//
// Per-(principal, tier) stake records plus the per-principal claimed flag.

#ifndef TIERSTAKE_STAKING_LEDGER_H
#define TIERSTAKE_STAKING_LEDGER_H

#include <tierstake/core/types.h>
#include <tierstake/staking/errors.h>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>

namespace tierstake {
namespace staking {

// ============================================================================
// Stake Record
// ============================================================================

struct StakeRecord {
    /// Principal currently locked
    Amount stakedAmount{0};

    /// Reward owed, fixed at deposit time
    Amount accruedReward{0};

    /// Claimable strictly after this time
    Timestamp unlockTimestamp{0};

    /// Paid out and reset
    bool claimed{false};

    bool IsEmpty() const { return stakedAmount == 0; }

    bool operator==(const StakeRecord& other) const {
        return stakedAmount == other.stakedAmount &&
               accruedReward == other.accruedReward &&
               unlockTimestamp == other.unlockTimestamp &&
               claimed == other.claimed;
    }
    bool operator!=(const StakeRecord& other) const { return !(*this == other); }

    std::string ToString() const;
};

/// Record key: principal and tier
using StakeKey = std::pair<Address, TierId>;

// ============================================================================
// Stake Ledger
// ============================================================================

/**
 * Central mutable stake state. Not internally synchronised.
 */
class StakeLedger {
public:
    using RecordMap = std::map<StakeKey, StakeRecord>;

    /// Saved state of one record, used to undo a claim
    struct Checkpoint {
        StakeKey key;
        bool hadRecord{false};
        StakeRecord record;
        bool hadClaimed{false};
    };

    StakeLedger() = default;

    /// Current record, or a zero record if none exists
    StakeRecord GetRecord(const Address& principal, TierId tierId) const;

    /**
     * Unlock time a deposit at `now` would produce, or nullopt when
     * unlockTimestamp + now + lockDuration leaves the Timestamp range.
     */
    std::optional<Timestamp> NextUnlockTime(const Address& principal, TierId tierId,
                                            Timestamp now, Duration lockDuration) const;

    /**
     * Add a deposit to the record:
     *   stakedAmount    += amount
     *   accruedReward   += reward
     *   unlockTimestamp  = unlockTimestamp + now + lockDuration
     *   claimed          = false
     * The previous unlock timestamp is carried into the sum, so repeated
     * deposits push the unlock time out cumulatively. Callers reject
     * deposits for which NextUnlockTime is nullopt; the sum saturates here.
     */
    StakeRecord ApplyDeposit(const Address& principal, TierId tierId, Amount amount,
                             Amount reward, Timestamp now, Duration lockDuration);

    /**
     * Validate and settle a claim. Checks, in order: NoActiveStake,
     * StakeAlreadyClaimed (per principal, any tier), StakeStillLocked
     * (now <= unlockTimestamp). On success the record is zeroed and marked
     * claimed, the principal's claimed flag is set and the payout returned.
     */
    ClaimResult ApplyClaim(const Address& principal, TierId tierId, Timestamp now);

    /// True once the principal has claimed on any tier
    bool HasClaimed(const Address& principal) const {
        return claimed_.count(principal) > 0;
    }

    Checkpoint MakeCheckpoint(const Address& principal, TierId tierId) const;

    void Rollback(const Checkpoint& checkpoint);

    /// Sum of stakedAmount over all records
    Amount GetTotalStaked() const;

    size_t Size() const { return records_.size(); }

    const RecordMap& GetRecords() const { return records_; }
    const std::set<Address>& GetClaimed() const { return claimed_; }

    void Restore(const RecordMap& records, const std::set<Address>& claimed);

private:
    RecordMap records_;
    std::set<Address> claimed_;
};

} // namespace staking
} // namespace tierstake

#endif // TIERSTAKE_STAKING_LEDGER_H
