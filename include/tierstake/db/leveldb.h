// TIERSTAKE - Database Backends
// Copyright (c) 2024 TIERSTAKE Developers
// MIT License
//
// LevelDB implementation of the database interface, plus the in-memory
// fallback used by tests and when LevelDB is not built in.

#ifndef TIERSTAKE_DB_LEVELDB_H
#define TIERSTAKE_DB_LEVELDB_H

#include "tierstake/db/database.h"

#include <map>
#include <mutex>

#ifdef TIERSTAKE_USE_LEVELDB
#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/filter_policy.h>
#include <leveldb/write_batch.h>
#endif

namespace tierstake {
namespace db {

#ifdef TIERSTAKE_USE_LEVELDB

/// Map a LevelDB status onto ours
Status ConvertStatus(const leveldb::Status& s);

// ============================================================================
// LevelDB Iterator Wrapper
// ============================================================================

class LevelDBIterator : public Iterator {
public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}

    bool Valid() const override { return iter_->Valid(); }
    void SeekToFirst() override { iter_->SeekToFirst(); }
    void Seek(const Slice& target) override {
        iter_->Seek(leveldb::Slice(target.data(), target.size()));
    }
    void Next() override { iter_->Next(); }

    Slice key() const override {
        leveldb::Slice k = iter_->key();
        return Slice(k.data(), k.size());
    }

    Slice value() const override {
        leveldb::Slice v = iter_->value();
        return Slice(v.data(), v.size());
    }

    Status status() const override { return ConvertStatus(iter_->status()); }

private:
    std::unique_ptr<leveldb::Iterator> iter_;
};

// ============================================================================
// LevelDB Database Implementation
// ============================================================================

class LevelDBDatabase : public Database {
public:
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const leveldb::FilterPolicy* filter)
        : db_(db), cache_(cache), filter_policy_(filter) {}

    ~LevelDBDatabase() override {
        // DB must close before its cache and filter are released
        db_.reset();
        cache_.reset();
        filter_policy_.reset();
    }

    using Database::Put;
    using Database::Delete;
    using Database::Write;

    Status Get(const Slice& key, std::string* value) override {
        return ConvertStatus(db_->Get(leveldb::ReadOptions(),
                                      leveldb::Slice(key.data(), key.size()), value));
    }

    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override {
        return ConvertStatus(db_->Put(MakeWriteOptions(options),
                                      leveldb::Slice(key.data(), key.size()),
                                      leveldb::Slice(value.data(), value.size())));
    }

    Status Delete(const WriteOptions& options, const Slice& key) override {
        return ConvertStatus(db_->Delete(MakeWriteOptions(options),
                                         leveldb::Slice(key.data(), key.size())));
    }

    Status Write(const WriteOptions& options, WriteBatch* batch) override {
        leveldb::WriteBatch lb;
        batch->Iterate([&lb](const std::string& key, const std::optional<std::string>& value) {
            if (value) {
                lb.Put(key, *value);
            } else {
                lb.Delete(key);
            }
        });
        return ConvertStatus(db_->Write(MakeWriteOptions(options), &lb));
    }

    std::unique_ptr<Iterator> NewIterator() override {
        return std::make_unique<LevelDBIterator>(db_->NewIterator(leveldb::ReadOptions()));
    }

    const char* Name() const override { return "leveldb"; }

private:
    static leveldb::WriteOptions MakeWriteOptions(const WriteOptions& opts) {
        leveldb::WriteOptions lo;
        lo.sync = opts.sync;
        return lo;
    }

    std::unique_ptr<leveldb::DB> db_;
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filter_policy_;
};

#endif // TIERSTAKE_USE_LEVELDB

// ============================================================================
// In-Memory Database
// ============================================================================

class MemoryDatabase : public Database {
public:
    MemoryDatabase() = default;

    using Database::Put;
    using Database::Delete;
    using Database::Write;

    Status Get(const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;

    /// Iterates over a copy taken at creation time
    std::unique_ptr<Iterator> NewIterator() override;

    const char* Name() const override { return "memory"; }

    size_t Size() const;

private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;
};

} // namespace db
} // namespace tierstake

#endif // TIERSTAKE_DB_LEVELDB_H
