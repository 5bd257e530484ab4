// TIERSTAKE - Staking Errors Implementation
// Copyright (c) 2024 TIERSTAKE Developers
// MIT License

#include "tierstake/staking/errors.h"

namespace tierstake {
namespace staking {

const char* StakeErrorToString(StakeError error) {
    switch (error) {
        case StakeError::None: return "None";
        case StakeError::NotOwner: return "NotOwner";
        case StakeError::NotApproved: return "NotApproved";
        case StakeError::InvalidTier: return "InvalidTier";
        case StakeError::ZeroAmount: return "ZeroAmount";
        case StakeError::CooldownActive: return "CooldownActive";
        case StakeError::NoActiveStake: return "NoActiveStake";
        case StakeError::StakeAlreadyClaimed: return "StakeAlreadyClaimed";
        case StakeError::StakeStillLocked: return "StakeStillLocked";
        case StakeError::TimestampOverflow: return "TimestampOverflow";
        case StakeError::TransferFailed: return "TransferFailed";
        default: return "Unknown";
    }
}

std::string StakeResult::ToString() const {
    if (IsOk()) {
        return "ok";
    }
    std::string out = StakeErrorToString(error);
    if (!message.empty()) {
        out += ": " + message;
    }
    return out;
}

} // namespace staking
} // namespace tierstake
