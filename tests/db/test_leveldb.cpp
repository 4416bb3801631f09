// QUORUM - LevelDB Tests
// Copyright (c) 2024 QUORUM Developers
// MIT License

#include <gtest/gtest.h>
#include "quorum/db/leveldb.h"

#include <filesystem>
#include <random>
#include <string>

using namespace quorum;
using namespace quorum::db;

class LevelDBTest : public ::testing::Test {
protected:
    std::filesystem::path testDir_;

    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);

        testDir_ = std::filesystem::temp_directory_path() /
                   ("quorum_leveldb_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }
};

TEST_F(LevelDBTest, OpenPutGet) {
    auto [status, db] = OpenLevelDB(testDir_ / "state");
    ASSERT_TRUE(status.ok()) << status.ToString();
    ASSERT_NE(db, nullptr);

    ASSERT_TRUE(db->Put(Slice("key1"), Slice("value1")).ok());
    std::string value;
    ASSERT_TRUE(db->Get(Slice("key1"), &value).ok());
    EXPECT_EQ(value, "value1");
    EXPECT_TRUE(db->Get(Slice("missing"), &value).IsNotFound());
}

TEST_F(LevelDBTest, DataSurvivesReopen) {
    {
        auto [status, db] = OpenLevelDB(testDir_ / "state");
        ASSERT_TRUE(status.ok());
        WriteBatch batch;
        batch.Put(Slice("a"), Slice("1"));
        batch.Put(Slice("b"), Slice("2"));
        batch.Delete(Slice("a"));
        WriteOptions sync;
        sync.sync = true;
        ASSERT_TRUE(db->Write(sync, &batch).ok());
    }

    auto [status, db] = OpenLevelDB(testDir_ / "state");
    ASSERT_TRUE(status.ok());
    EXPECT_FALSE(db->Exists(Slice("a")));
    std::string value;
    ASSERT_TRUE(db->Get(Slice("b"), &value).ok());
    EXPECT_EQ(value, "2");
}

TEST_F(LevelDBTest, IteratorOrder) {
    auto [status, db] = OpenLevelDB(testDir_ / "state");
    ASSERT_TRUE(status.ok());
    db->Put(Slice("l"), Slice("ledger"));
    db->Put(Slice("g"), Slice("governance"));
    db->Put(Slice("t"), Slice("token"));

    auto it = db->NewIterator();
    it->SeekToFirst();
    ASSERT_TRUE(it->Valid());
    EXPECT_EQ(it->key().ToString(), "g");
    it->Seek(Slice("m"));
    ASSERT_TRUE(it->Valid());
    EXPECT_EQ(it->value().ToString(), "token");
    EXPECT_TRUE(it->status().ok());
}

TEST_F(LevelDBTest, ErrorIfExists) {
    {
        auto [status, db] = OpenLevelDB(testDir_ / "state");
        ASSERT_TRUE(status.ok());
    }
    Options options;
    options.error_if_exists = true;
    auto [status, db] = OpenLevelDB(testDir_ / "state", options);
    EXPECT_FALSE(status.ok());
    EXPECT_EQ(db, nullptr);
}

TEST_F(LevelDBTest, Destroy) {
    {
        auto [status, db] = OpenLevelDB(testDir_ / "state");
        ASSERT_TRUE(status.ok());
        db->Put(Slice("k"), Slice("v"));
    }
    ASSERT_TRUE(DestroyLevelDB(testDir_ / "state").ok());

    auto [status, db] = OpenLevelDB(testDir_ / "state");
    ASSERT_TRUE(status.ok());
    EXPECT_FALSE(db->Exists(Slice("k")));
}
