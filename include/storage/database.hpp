#pragma once

#include "types/hash32.hpp"
#include <sqlite3.h>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace stark_sync {
namespace storage {

/**
 * @brief Abstract key-value database
 *
 * The storage engine is a collaborator: the synchronizer only needs point
 * reads and writes, atomic batches and prefix scans. Write failures are
 * reported as `false` and turned into PersistenceError by the callers that
 * own a retry policy.
 */
class Database {
public:
    virtual ~Database() = default;

    virtual bool put(const Bytes& key, const Bytes& value) = 0;
    virtual std::optional<Bytes> get(const Bytes& key) = 0;
    virtual bool del(const Bytes& key) = 0;
    virtual bool exists(const Bytes& key) = 0;

    // Applied all-or-nothing
    struct WriteBatch {
        std::vector<std::pair<Bytes, Bytes>> puts;
        std::vector<Bytes> deletes;

        void put(Bytes key, Bytes value) { puts.emplace_back(std::move(key), std::move(value)); }
        void del(Bytes key) { deletes.push_back(std::move(key)); }
        bool empty() const { return puts.empty() && deletes.empty(); }
        size_t size() const { return puts.size() + deletes.size(); }
        void append(const WriteBatch& other);
    };
    virtual bool write_batch(const WriteBatch& batch) = 0;

    // Iterator over a snapshot of the keys starting with a prefix, in key order
    class Iterator {
    public:
        virtual ~Iterator() = default;
        virtual bool valid() = 0;
        virtual void next() = 0;
        virtual Bytes key() = 0;
        virtual Bytes value() = 0;
    };
    virtual std::unique_ptr<Iterator> new_iterator(const Bytes& prefix) = 0;
};

/**
 * @brief In-memory database for tests and ephemeral runs
 */
class MemoryDatabase : public Database {
public:
    bool put(const Bytes& key, const Bytes& value) override;
    std::optional<Bytes> get(const Bytes& key) override;
    bool del(const Bytes& key) override;
    bool exists(const Bytes& key) override;
    bool write_batch(const WriteBatch& batch) override;
    std::unique_ptr<Iterator> new_iterator(const Bytes& prefix) override;

    size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<Bytes, Bytes> data_;
};

/**
 * @brief Persistent database backed by SQLite
 *
 * One `kv` table keyed by BLOB, so prefix scans follow the same byte order
 * as MemoryDatabase. The file runs in WAL mode with synchronous=FULL: a
 * write or batch that returned true has been synced to disk. A batch is a
 * single transaction.
 *
 * @throws PersistenceError from the constructor when the file cannot be
 *         opened or the schema cannot be created
 */
class SqliteDatabase : public Database {
public:
    explicit SqliteDatabase(const std::string& path);
    ~SqliteDatabase() override;

    SqliteDatabase(const SqliteDatabase&) = delete;
    SqliteDatabase& operator=(const SqliteDatabase&) = delete;

    bool put(const Bytes& key, const Bytes& value) override;
    std::optional<Bytes> get(const Bytes& key) override;
    bool del(const Bytes& key) override;
    bool exists(const Bytes& key) override;
    bool write_batch(const WriteBatch& batch) override;
    std::unique_ptr<Iterator> new_iterator(const Bytes& prefix) override;

    const std::string& path() const { return path_; }

private:
    void put_locked(const Bytes& key, const Bytes& value);
    void del_locked(const Bytes& key);

    std::string path_;
    std::mutex mutex_;
    sqlite3* db_ = nullptr;
};

/**
 * @brief View of another database with every key prefixed
 *
 * Gives each logical store (checkpoints, tries, code, ...) its own key space
 * inside one physical database.
 */
class PrefixedDatabase : public Database {
public:
    PrefixedDatabase(std::shared_ptr<Database> base, const std::string& prefix);

    bool put(const Bytes& key, const Bytes& value) override;
    std::optional<Bytes> get(const Bytes& key) override;
    bool del(const Bytes& key) override;
    bool exists(const Bytes& key) override;
    bool write_batch(const WriteBatch& batch) override;
    std::unique_ptr<Iterator> new_iterator(const Bytes& prefix) override;

    // Key as stored in the base database, for staging into a shared batch
    Bytes full_key(const Bytes& key) const;

private:
    std::shared_ptr<Database> base_;
    Bytes prefix_;
};

// Helpers for string keys
inline Bytes to_key(const std::string& s) { return Bytes(s.begin(), s.end()); }
inline std::string key_to_string(const Bytes& b) { return std::string(b.begin(), b.end()); }

} // namespace storage
} // namespace stark_sync
