// TIERSTAKE - Stake Ledger Implementation
// Copyright (c) 2024 TIERSTAKE Developers
// MIT License

#include "tierstake/staking/ledger.h"
#include "tierstake/util/logging.h"
#include "tierstake/util/time.h"

#include <sstream>

namespace tierstake {
namespace staking {

std::string StakeRecord::ToString() const {
    std::ostringstream oss;
    oss << "StakeRecord(staked=" << stakedAmount
        << ", reward=" << accruedReward
        << ", unlock=" << unlockTimestamp
        << ", claimed=" << (claimed ? "true" : "false") << ")";
    return oss.str();
}

StakeRecord StakeLedger::GetRecord(const Address& principal, TierId tierId) const {
    auto it = records_.find({principal, tierId});
    if (it == records_.end()) {
        return StakeRecord{};
    }
    return it->second;
}

std::optional<Timestamp> StakeLedger::NextUnlockTime(const Address& principal, TierId tierId,
                                                     Timestamp now, Duration lockDuration) const {
    auto partial = util::CheckedAddTime(GetRecord(principal, tierId).unlockTimestamp, now);
    if (!partial) {
        return std::nullopt;
    }
    return util::CheckedAddTime(*partial, lockDuration);
}

StakeRecord StakeLedger::ApplyDeposit(const Address& principal, TierId tierId, Amount amount,
                                      Amount reward, Timestamp now, Duration lockDuration) {
    StakeRecord& record = records_[{principal, tierId}];
    record.stakedAmount += amount;
    record.accruedReward += reward;
    record.unlockTimestamp = util::SaturatingAddTime(
        util::SaturatingAddTime(record.unlockTimestamp, now), lockDuration);
    record.claimed = false;

    LOG_TRACE(util::LogCategory::LEDGER) << principal.ToHex() << "/" << tierId
        << " -> " << record.ToString();
    return record;
}

ClaimResult StakeLedger::ApplyClaim(const Address& principal, TierId tierId, Timestamp now) {
    ClaimResult result;

    auto it = records_.find({principal, tierId});
    if (it == records_.end() || it->second.IsEmpty()) {
        result.status = StakeResult::Failure(StakeError::NoActiveStake,
                                             "no stake in tier " + std::to_string(tierId));
        return result;
    }

    if (HasClaimed(principal)) {
        result.status = StakeResult::Failure(StakeError::StakeAlreadyClaimed,
                                             principal.ToHex() + " has already claimed");
        return result;
    }

    StakeRecord& record = it->second;
    if (now <= record.unlockTimestamp) {
        result.status = StakeResult::Failure(
            StakeError::StakeStillLocked,
            "locked until " + util::FormatISO8601(record.unlockTimestamp),
            util::SaturatingAddTime(record.unlockTimestamp, 1));
        return result;
    }

    result.payout = record.stakedAmount + record.accruedReward;
    record = StakeRecord{};
    record.claimed = true;
    claimed_.insert(principal);

    result.status = StakeResult::Success();
    return result;
}

StakeLedger::Checkpoint StakeLedger::MakeCheckpoint(const Address& principal,
                                                    TierId tierId) const {
    Checkpoint cp;
    cp.key = {principal, tierId};
    auto it = records_.find(cp.key);
    if (it != records_.end()) {
        cp.hadRecord = true;
        cp.record = it->second;
    }
    cp.hadClaimed = HasClaimed(principal);
    return cp;
}

void StakeLedger::Rollback(const Checkpoint& checkpoint) {
    if (checkpoint.hadRecord) {
        records_[checkpoint.key] = checkpoint.record;
    } else {
        records_.erase(checkpoint.key);
    }

    if (checkpoint.hadClaimed) {
        claimed_.insert(checkpoint.key.first);
    } else {
        claimed_.erase(checkpoint.key.first);
    }
}

Amount StakeLedger::GetTotalStaked() const {
    Amount total = 0;
    for (const auto& [key, record] : records_) {
        total += record.stakedAmount;
    }
    return total;
}

void StakeLedger::Restore(const RecordMap& records, const std::set<Address>& claimed) {
    records_ = records;
    claimed_ = claimed;
}

} // namespace staking
} // namespace tierstake
