// TIERSTAKE - Ledger Store Implementation
// Copyright (c) 2024 TIERSTAKE Developers
// MIT License

#include "tierstake/staking/store.h"
#include "tierstake/core/serialize.h"
#include "tierstake/util/logging.h"

#include <cstring>
#include <ios>

namespace tierstake {
namespace staking {

namespace {

/// Prefixes owned by the engine snapshot
const char SNAPSHOT_PREFIXES[] = {
    db::prefix::OWNER, db::prefix::SETTINGS, db::prefix::TIER, db::prefix::RECORD,
    db::prefix::APPROVAL, db::prefix::LAST_DEPOSIT, db::prefix::CLAIMED, '\0'
};

const char BALANCE_PREFIXES[] = { db::prefix::BALANCE, '\0' };

template<typename... Fields>
std::string Encode(const Fields&... fields) {
    DataStream ss;
    (ss << ... << fields);
    return ss.str();
}

/// Decode exactly the given fields; false on short or trailing data
template<typename... Fields>
bool Decode(const std::string& bytes, Fields&... fields) {
    try {
        DataStream ss(bytes);
        (ss >> ... >> fields);
        return ss.empty();
    } catch (const std::ios_base::failure&) {
        return false;
    }
}

db::Status Corrupt(const std::string& key) {
    return db::Status::Corruption("malformed entry with prefix '" + key.substr(0, 1) + "'");
}

} // namespace

void LedgerStore::ClearPrefixes(const char* prefixes, db::WriteBatch& batch) {
    auto it = db_.NewIterator();
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        db::Slice key = it->key();
        if (!key.empty() && std::strchr(prefixes, key.data()[0]) != nullptr) {
            batch.Delete(key);
        }
    }
}

db::Status LedgerStore::Save(const LedgerSnapshot& snapshot,
                             const InMemoryAssetLedger::BalanceMap* balances) {
    db::WriteBatch batch;
    ClearPrefixes(SNAPSHOT_PREFIXES, batch);
    if (balances) {
        ClearPrefixes(BALANCE_PREFIXES, batch);
    }

    batch.Put(db::MakeKey(db::prefix::OWNER), Encode(snapshot.owner));
    batch.Put(db::MakeKey(db::prefix::SETTINGS),
              Encode(snapshot.options.cooldownPeriod, snapshot.options.custody));

    for (const auto& [id, tier] : snapshot.tiers) {
        batch.Put(db::MakeKey(db::prefix::TIER, id),
                  Encode(tier.rewardRateBps, tier.lockDuration));
    }
    for (const auto& principal : snapshot.approved) {
        batch.Put(db::MakeKey(db::prefix::APPROVAL, principal), Encode(true));
    }
    for (const auto& [principal, time] : snapshot.lastDeposit) {
        batch.Put(db::MakeKey(db::prefix::LAST_DEPOSIT, principal), Encode(time));
    }
    for (const auto& [key, record] : snapshot.records) {
        batch.Put(db::MakeKey(db::prefix::RECORD, key.first, key.second),
                  Encode(record.stakedAmount, record.accruedReward,
                         record.unlockTimestamp, record.claimed));
    }
    for (const auto& principal : snapshot.claimed) {
        batch.Put(db::MakeKey(db::prefix::CLAIMED, principal), Encode(true));
    }
    if (balances) {
        for (const auto& [account, amount] : *balances) {
            batch.Put(db::MakeKey(db::prefix::BALANCE, account), Encode(amount));
        }
    }

    db::WriteOptions options;
    options.sync = true;
    db::Status status = db_.Write(options, &batch);
    if (!status.ok()) {
        LogErrorF(util::LogCategory::DB, "Failed to save ledger: %s", status.ToString().c_str());
        return status;
    }

    LogDebugF(util::LogCategory::DB, "Saved ledger snapshot (%zu operations)", batch.Count());
    return status;
}

db::Status LedgerStore::Load(std::optional<LedgerSnapshot>& out) {
    out.reset();

    std::string value;
    db::Status status = db_.Get(db::MakeKey(db::prefix::OWNER), &value);
    if (status.IsNotFound()) {
        return db::Status::Ok();
    }
    if (!status.ok()) {
        return status;
    }

    LedgerSnapshot snapshot;
    if (!Decode(value, snapshot.owner)) {
        return Corrupt(db::MakeKey(db::prefix::OWNER));
    }

    auto it = db_.NewIterator();
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        std::string key = it->key().ToString();
        std::string val = it->value().ToString();
        if (key.empty()) {
            continue;
        }
        std::string body = key.substr(1);

        switch (key[0]) {
            case db::prefix::SETTINGS:
                if (!Decode(val, snapshot.options.cooldownPeriod, snapshot.options.custody)) {
                    return Corrupt(key);
                }
                break;

            case db::prefix::TIER: {
                TierId id = 0;
                Tier tier;
                if (!Decode(body, id) || !Decode(val, tier.rewardRateBps, tier.lockDuration)) {
                    return Corrupt(key);
                }
                snapshot.tiers[id] = tier;
                break;
            }

            case db::prefix::APPROVAL: {
                Address principal;
                bool approved = false;
                if (!Decode(body, principal) || !Decode(val, approved)) {
                    return Corrupt(key);
                }
                if (approved) {
                    snapshot.approved.insert(principal);
                }
                break;
            }

            case db::prefix::LAST_DEPOSIT: {
                Address principal;
                Timestamp time = 0;
                if (!Decode(body, principal) || !Decode(val, time)) {
                    return Corrupt(key);
                }
                snapshot.lastDeposit[principal] = time;
                break;
            }

            case db::prefix::RECORD: {
                Address principal;
                TierId id = 0;
                StakeRecord record;
                if (!Decode(body, principal, id) ||
                    !Decode(val, record.stakedAmount, record.accruedReward,
                            record.unlockTimestamp, record.claimed)) {
                    return Corrupt(key);
                }
                snapshot.records[{principal, id}] = record;
                break;
            }

            case db::prefix::CLAIMED: {
                Address principal;
                bool claimed = false;
                if (!Decode(body, principal) || !Decode(val, claimed)) {
                    return Corrupt(key);
                }
                if (claimed) {
                    snapshot.claimed.insert(principal);
                }
                break;
            }

            default:
                break;
        }
    }

    if (!it->status().ok()) {
        return it->status();
    }

    LOG_DEBUG(util::LogCategory::DB) << "Loaded ledger snapshot: " << snapshot.tiers.size()
        << " tiers, " << snapshot.records.size() << " records";
    out = std::move(snapshot);
    return db::Status::Ok();
}

db::Status LedgerStore::LoadBalances(InMemoryAssetLedger::BalanceMap& out) {
    out.clear();

    auto it = db_.NewIterator();
    for (it->Seek(db::MakeKey(db::prefix::BALANCE)); it->Valid(); it->Next()) {
        std::string key = it->key().ToString();
        if (key.empty() || key[0] != db::prefix::BALANCE) {
            break;
        }
        Address account;
        Amount amount = 0;
        if (!Decode(key.substr(1), account) || !Decode(it->value().ToString(), amount)) {
            return Corrupt(key);
        }
        out[account] = amount;
    }
    return it->status();
}

} // namespace staking
} // namespace tierstake
