// TIERSTAKE - Access Control Implementation
// Copyright (c) 2024 TIERSTAKE Developers
// MIT License

#include "tierstake/staking/access.h"
#include "tierstake/util/logging.h"

namespace tierstake {
namespace staking {

StakeResult AccessControl::RequireOwner(const Address& caller) const {
    if (caller != owner_) {
        return StakeResult::Failure(StakeError::NotOwner,
                                    caller.ToHex() + " is not the owner");
    }
    return StakeResult::Success();
}

StakeResult AccessControl::RequireApproved(const Address& caller) const {
    if (!IsApproved(caller)) {
        return StakeResult::Failure(StakeError::NotApproved,
                                    caller.ToHex() + " is not whitelisted");
    }
    return StakeResult::Success();
}

void AccessControl::SetApproval(const Address& principal, bool approved) {
    if (approved) {
        approved_.insert(principal);
    } else {
        approved_.erase(principal);
    }
    LOG_DEBUG(util::LogCategory::ACCESS) << principal.ToHex()
        << (approved ? " approved" : " revoked")
        << " (" << approved_.size() << " whitelisted)";
}

} // namespace staking
} // namespace tierstake
