// TIERSTAKE - Database Tests
// Copyright (c) 2024 TIERSTAKE Developers
// MIT License

#include <gtest/gtest.h>
#include "tierstake/db/database.h"
#include "tierstake/db/leveldb.h"
#include <filesystem>
#include <random>

using namespace tierstake;
using namespace tierstake::db;

// ============================================================================
// Test Utilities
// ============================================================================

class DatabaseTest : public ::testing::Test {
protected:
    std::filesystem::path testDir_;

    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);

        testDir_ = std::filesystem::temp_directory_path() /
                   ("tierstake_db_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }
};

// ============================================================================
// Basic Database Tests
// ============================================================================

TEST_F(DatabaseTest, OpenCreatesDirectories) {
    auto [status, db] = OpenDatabase(testDir_ / "nested" / "ledger");
    ASSERT_TRUE(status.ok()) << status.ToString();
    ASSERT_NE(db, nullptr);
    EXPECT_TRUE(std::filesystem::exists(testDir_ / "nested"));
}

TEST_F(DatabaseTest, PutAndGet) {
    auto [status, db] = OpenDatabase(testDir_ / "test_db");
    ASSERT_TRUE(status.ok());

    Status s = db->Put(Slice("key1"), Slice("value1"));
    ASSERT_TRUE(s.ok());

    std::string value;
    s = db->Get(Slice("key1"), &value);
    ASSERT_TRUE(s.ok());
    EXPECT_EQ(value, "value1");
}

TEST_F(DatabaseTest, GetNotFound) {
    auto [status, db] = OpenDatabase(testDir_ / "test_db");
    ASSERT_TRUE(status.ok());

    std::string value;
    Status s = db->Get(Slice("nonexistent"), &value);
    EXPECT_TRUE(s.IsNotFound());
}

TEST_F(DatabaseTest, Delete) {
    auto db = OpenMemoryDatabase();

    ASSERT_TRUE(db->Put(Slice("key1"), Slice("value1")).ok());
    ASSERT_TRUE(db->Delete(Slice("key1")).ok());

    std::string value;
    EXPECT_TRUE(db->Get(Slice("key1"), &value).IsNotFound());
}

TEST_F(DatabaseTest, WriteBatchAppliesInOrder) {
    auto db = OpenMemoryDatabase();
    ASSERT_TRUE(db->Put(Slice("stale"), Slice("x")).ok());

    db::WriteBatch batch;
    batch.Put(Slice("key1"), Slice("value1"));
    batch.Put(Slice("key2"), Slice("value2"));
    batch.Delete(Slice("key2"));
    batch.Delete(Slice("stale"));
    batch.Put(Slice("stale"), Slice("fresh"));
    EXPECT_EQ(batch.Count(), 5u);

    ASSERT_TRUE(db->Write(&batch).ok());

    std::string value;
    ASSERT_TRUE(db->Get(Slice("key1"), &value).ok());
    EXPECT_EQ(value, "value1");
    EXPECT_TRUE(db->Get(Slice("key2"), &value).IsNotFound());
    ASSERT_TRUE(db->Get(Slice("stale"), &value).ok());
    EXPECT_EQ(value, "fresh");
}

TEST_F(DatabaseTest, IteratorIsOrderedAndSeeks) {
    auto db = OpenMemoryDatabase();
    db->Put(Slice("b"), Slice("2"));
    db->Put(Slice("a"), Slice("1"));
    db->Put(Slice("c"), Slice("3"));

    auto iter = db->NewIterator();
    std::string keys;
    for (iter->SeekToFirst(); iter->Valid(); iter->Next()) {
        keys += iter->key().ToString();
    }
    EXPECT_EQ(keys, "abc");
    EXPECT_TRUE(iter->status().ok());

    iter->Seek(Slice("b"));
    ASSERT_TRUE(iter->Valid());
    EXPECT_EQ(iter->value().ToString(), "2");
}

TEST_F(DatabaseTest, IteratorIgnoresLaterWrites) {
    MemoryDatabase db;
    db.Put(Slice("a"), Slice("1"));

    auto iter = db.NewIterator();
    db.Put(Slice("b"), Slice("2"));

    int count = 0;
    for (iter->SeekToFirst(); iter->Valid(); iter->Next()) {
        ++count;
    }
    EXPECT_EQ(count, 1);
    EXPECT_EQ(db.Size(), 2u);
}

TEST_F(DatabaseTest, Exists) {
    auto db = OpenMemoryDatabase();
    db->Put(Slice("key1"), Slice("value1"));

    EXPECT_TRUE(db->Exists(Slice("key1")));
    EXPECT_FALSE(db->Exists(Slice("key2")));
}

// ============================================================================
// Keys
// ============================================================================

TEST_F(DatabaseTest, MakeKey) {
    std::string key1 = MakeKey(prefix::OWNER);
    EXPECT_EQ(key1.size(), 1u);
    EXPECT_EQ(key1[0], prefix::OWNER);

    std::string key2 = MakeKey(prefix::RECORD, MakeAddress(7), TierId{2});
    ASSERT_EQ(key2.size(), 1u + Hash160::SIZE + 4u);
    EXPECT_EQ(key2[0], prefix::RECORD);
    EXPECT_EQ(static_cast<uint8_t>(key2[Hash160::SIZE]), 7);
    EXPECT_EQ(static_cast<uint8_t>(key2[Hash160::SIZE + 1]), 2);
}

// ============================================================================
// Status Tests
// ============================================================================

TEST_F(DatabaseTest, StatusOk) {
    Status s = Status::Ok();
    EXPECT_TRUE(s.ok());
    EXPECT_FALSE(s.IsNotFound());
    EXPECT_FALSE(s.IsCorruption());
    EXPECT_FALSE(s.IsIOError());
    EXPECT_EQ(s.ToString(), "OK");
}

TEST_F(DatabaseTest, StatusToString) {
    Status s = Status::NotFound("test message");
    std::string str = s.ToString();
    EXPECT_NE(str.find("NotFound"), std::string::npos);
    EXPECT_NE(str.find("test message"), std::string::npos);

    EXPECT_TRUE(Status::Corruption("bad").IsCorruption());
    EXPECT_TRUE(Status::IOError("disk full").IsIOError());
}

// ============================================================================
// Slice Tests
// ============================================================================

TEST_F(DatabaseTest, SliceBasic) {
    std::string data = "hello world";
    Slice slice(data);

    EXPECT_EQ(slice.size(), data.size());
    EXPECT_EQ(slice.ToString(), data);
    EXPECT_FALSE(slice.empty());
    EXPECT_TRUE(slice.starts_with(Slice("hello")));
    EXPECT_FALSE(slice.starts_with(Slice("world")));
}

TEST_F(DatabaseTest, SliceEmpty) {
    Slice empty;
    EXPECT_TRUE(empty.empty());
    EXPECT_EQ(empty.size(), 0u);
}
