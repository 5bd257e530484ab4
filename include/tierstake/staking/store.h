// TIERSTAKE - Ledger Store
// Copyright (c) 2024 TIERSTAKE Developers
// MIT License
//
// Persists the engine state (and optionally asset balances) in a key-value
// database under the prefixes in db::prefix.

#ifndef TIERSTAKE_STAKING_STORE_H
#define TIERSTAKE_STAKING_STORE_H

#include <tierstake/db/database.h>
#include <tierstake/staking/engine.h>
#include <tierstake/staking/transfer.h>

#include <optional>

namespace tierstake {
namespace staking {

class LedgerStore {
public:
    explicit LedgerStore(db::Database& database) : db_(database) {}

    /**
     * Replace the stored snapshot in one atomic batch. When `balances` is
     * given the stored balances are replaced in the same batch.
     */
    db::Status Save(const LedgerSnapshot& snapshot,
                    const InMemoryAssetLedger::BalanceMap* balances = nullptr);

    /// Load the snapshot. `out` is left empty when nothing was saved.
    db::Status Load(std::optional<LedgerSnapshot>& out);

    db::Status LoadBalances(InMemoryAssetLedger::BalanceMap& out);

private:
    void ClearPrefixes(const char* prefixes, db::WriteBatch& batch);

    db::Database& db_;
};

} // namespace staking
} // namespace tierstake

#endif // TIERSTAKE_STAKING_STORE_H
