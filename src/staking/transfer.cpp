// TIERSTAKE - Asset Transfer Implementation
// Copyright (c) 2024 TIERSTAKE Developers
// MIT License

#include "tierstake/staking/transfer.h"
#include "tierstake/util/logging.h"

#include <exception>

namespace tierstake {
namespace staking {

// ============================================================================
// Exception-safe wrappers
// ============================================================================

bool TryTransferIn(IAssetTransfer& transfer, const Address& from,
                   const Address& to, Amount amount) {
    try {
        return transfer.TransferIn(from, to, amount);
    } catch (const std::exception& e) {
        LOG_WARN(util::LogCategory::LEDGER) << "TransferIn from " << from.ToHex()
            << " threw: " << e.what();
        return false;
    }
}

bool TryTransferOut(IAssetTransfer& transfer, const Address& to, Amount amount) {
    try {
        return transfer.TransferOut(to, amount);
    } catch (const std::exception& e) {
        LOG_WARN(util::LogCategory::LEDGER) << "TransferOut to " << to.ToHex()
            << " threw: " << e.what();
        return false;
    }
}

// ============================================================================
// InMemoryAssetLedger
// ============================================================================

InMemoryAssetLedger::InMemoryAssetLedger(const Address& custody)
    : custody_(custody) {}

bool InMemoryAssetLedger::Move(const Address& from, const Address& to, Amount amount) {
    auto it = balances_.find(from);
    Amount available = (it == balances_.end()) ? 0 : it->second;
    if (available < amount) {
        LOG_DEBUG(util::LogCategory::LEDGER) << "Insufficient balance for "
            << from.ToHex() << ": " << available << " < " << amount;
        return false;
    }
    if (from == to) {
        return true;
    }

    Amount& dest = balances_[to];
    if (dest > MAX_AMOUNT - amount) {
        return false;
    }

    balances_[from] -= amount;
    dest += amount;
    return true;
}

bool InMemoryAssetLedger::TransferIn(const Address& from, const Address& to, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    return Move(from, to, amount);
}

bool InMemoryAssetLedger::TransferOut(const Address& to, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    return Move(custody_, to, amount);
}

bool InMemoryAssetLedger::Credit(const Address& account, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    Amount& balance = balances_[account];
    if (balance > MAX_AMOUNT - amount) {
        return false;
    }
    balance += amount;
    return true;
}

Amount InMemoryAssetLedger::BalanceOf(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
}

InMemoryAssetLedger::BalanceMap InMemoryAssetLedger::GetBalances() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return balances_;
}

void InMemoryAssetLedger::Restore(const BalanceMap& balances) {
    std::lock_guard<std::mutex> lock(mutex_);
    balances_ = balances;
}

} // namespace staking
} // namespace tierstake
