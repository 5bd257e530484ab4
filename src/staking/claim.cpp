// TIERSTAKE - Claim Processing Implementation
// Copyright (c) 2024 TIERSTAKE Developers
// MIT License

#include "tierstake/staking/claim.h"
#include "tierstake/staking/ledger.h"
#include "tierstake/staking/transfer.h"
#include "tierstake/util/logging.h"

namespace tierstake {
namespace staking {

ClaimResult ClaimProcessor::Process(const Address& principal, TierId tierId, Timestamp now) {
    StakeLedger::Checkpoint checkpoint = ledger_.MakeCheckpoint(principal, tierId);

    ClaimResult result = ledger_.ApplyClaim(principal, tierId, now);
    if (!result.IsOk()) {
        return result;
    }

    if (!TryTransferOut(transfer_, principal, result.payout)) {
        ledger_.Rollback(checkpoint);
        LOG_DEBUG(util::LogCategory::LEDGER) << "Rolled back claim of " << result.payout
            << " for " << principal.ToHex() << "/" << tierId;
        result.status = StakeResult::Failure(
            StakeError::TransferFailed,
            "payout of " + std::to_string(result.payout) + " failed");
        result.payout = 0;
    }
    return result;
}

} // namespace staking
} // namespace tierstake
