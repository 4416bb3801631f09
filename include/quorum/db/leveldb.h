// QUORUM - LevelDB Wrapper
// Copyright (c) 2024 QUORUM Developers
// MIT License
//
// LevelDB implementation of the database interface. Built into the
// quorum_leveldb library only when the build finds LevelDB.

#ifndef QUORUM_DB_LEVELDB_H
#define QUORUM_DB_LEVELDB_H

#include "quorum/db/database.h"

#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/filter_policy.h>

#include <filesystem>
#include <memory>
#include <string>
#include <utility>

namespace quorum {
namespace db {

class LevelDBDatabase : public Database {
public:
    /// Takes ownership of db, cache and filter
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const leveldb::FilterPolicy* filter,
                    const std::filesystem::path& path);
    ~LevelDBDatabase() override;

    LevelDBDatabase(const LevelDBDatabase&) = delete;
    LevelDBDatabase& operator=(const LevelDBDatabase&) = delete;

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;
    void Compact() override;
    std::string GetStats() const override;

    const std::filesystem::path& GetPath() const { return path_; }

    static Status ConvertStatus(const leveldb::Status& s);

private:
    // Declaration order is destruction order reversed: db_ goes first
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filterPolicy_;
    std::unique_ptr<leveldb::DB> db_;
    std::filesystem::path path_;
};

/**
 * Open (and by default create) a LevelDB database at path.
 * @return Pair of (status, database pointer); the pointer is null on failure
 */
std::pair<Status, std::unique_ptr<Database>> OpenLevelDB(
    const std::filesystem::path& path,
    const Options& options = Options());

/// Delete all data of the database at path
Status DestroyLevelDB(const std::filesystem::path& path);

} // namespace db
} // namespace quorum

#endif // QUORUM_DB_LEVELDB_H
