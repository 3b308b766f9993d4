#include "storage/database.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <iostream>
#include <mutex>
#include <string>

namespace stark_sync {
namespace storage {

namespace {

bool has_prefix(const Bytes& key, const Bytes& prefix) {
    return key.size() >= prefix.size() &&
           std::equal(prefix.begin(), prefix.end(), key.begin());
}

/**
 * Iterator over a copied snapshot, so callers never hold the database lock
 * while iterating.
 */
class SnapshotIterator : public Database::Iterator {
public:
    explicit SnapshotIterator(std::vector<std::pair<Bytes, Bytes>> entries)
        : entries_(std::move(entries)) {}

    bool valid() override { return index_ < entries_.size(); }
    void next() override { ++index_; }
    Bytes key() override { return entries_[index_].first; }
    Bytes value() override { return entries_[index_].second; }

private:
    std::vector<std::pair<Bytes, Bytes>> entries_;
    size_t index_ = 0;
};

std::vector<std::pair<Bytes, Bytes>> collect_prefix(const std::map<Bytes, Bytes>& data,
                                                    const Bytes& prefix) {
    std::vector<std::pair<Bytes, Bytes>> entries;
    for (auto it = data.lower_bound(prefix); it != data.end() && has_prefix(it->first, prefix); ++it) {
        entries.emplace_back(it->first, it->second);
    }
    return entries;
}

// SQLite helpers

struct Stmt {
    sqlite3_stmt* s = nullptr;
    ~Stmt() { if (s) sqlite3_finalize(s); }
};

void check_sql(int rc, sqlite3* db, const char* what) {
    if (rc != SQLITE_OK && rc != SQLITE_DONE && rc != SQLITE_ROW) {
        throw PersistenceError(std::string(what) + " failed: " + sqlite3_errmsg(db) +
                               " (rc=" + std::to_string(rc) + ")");
    }
}

void exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw PersistenceError("sqlite exec failed: " + msg);
    }
}

void prepare(sqlite3* db, Stmt& st, const char* sql) {
    check_sql(sqlite3_prepare_v2(db, sql, -1, &st.s, nullptr), db, sql);
}

// A null pointer would bind SQL NULL, so empty blobs get a valid one
void bind_blob(sqlite3* db, Stmt& st, int index, const Bytes& blob) {
    static const uint8_t empty = 0;
    const void* data = blob.empty() ? &empty : blob.data();
    check_sql(sqlite3_bind_blob(st.s, index, data, static_cast<int>(blob.size()), SQLITE_TRANSIENT),
              db, "bind");
}

Bytes column_blob(Stmt& st, int column) {
    const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(st.s, column));
    int size = sqlite3_column_bytes(st.s, column);
    if (!data || size <= 0) {
        return {};
    }
    return Bytes(data, data + size);
}

} // namespace

void Database::WriteBatch::append(const WriteBatch& other) {
    puts.insert(puts.end(), other.puts.begin(), other.puts.end());
    deletes.insert(deletes.end(), other.deletes.begin(), other.deletes.end());
}

// ============================================================================
// MemoryDatabase
// ============================================================================

bool MemoryDatabase::put(const Bytes& key, const Bytes& value) {
    std::unique_lock lock(mutex_);
    data_[key] = value;
    return true;
}

std::optional<Bytes> MemoryDatabase::get(const Bytes& key) {
    std::shared_lock lock(mutex_);
    auto it = data_.find(key);
    if (it != data_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool MemoryDatabase::del(const Bytes& key) {
    std::unique_lock lock(mutex_);
    return data_.erase(key) > 0;
}

bool MemoryDatabase::exists(const Bytes& key) {
    std::shared_lock lock(mutex_);
    return data_.find(key) != data_.end();
}

bool MemoryDatabase::write_batch(const WriteBatch& batch) {
    std::unique_lock lock(mutex_);
    for (const auto& [key, value] : batch.puts) {
        data_[key] = value;
    }
    for (const auto& key : batch.deletes) {
        data_.erase(key);
    }
    return true;
}

std::unique_ptr<Database::Iterator> MemoryDatabase::new_iterator(const Bytes& prefix) {
    std::shared_lock lock(mutex_);
    return std::make_unique<SnapshotIterator>(collect_prefix(data_, prefix));
}

size_t MemoryDatabase::size() const {
    std::shared_lock lock(mutex_);
    return data_.size();
}

// ============================================================================
// SqliteDatabase
// ============================================================================

SqliteDatabase::SqliteDatabase(const std::string& path) : path_(path) {
    int rc = sqlite3_open(path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw PersistenceError("Failed to open database path=" + path_ + ": " + msg);
    }
    try {
        exec_sql(db_, "PRAGMA journal_mode = WAL;");
        exec_sql(db_, "PRAGMA synchronous = FULL;");
        exec_sql(db_, "CREATE TABLE IF NOT EXISTS kv (key BLOB PRIMARY KEY, value BLOB NOT NULL) WITHOUT ROWID;");
    } catch (const PersistenceError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    std::cout << "[storage] Opened sqlite database path=" << path_ << std::endl;
}

SqliteDatabase::~SqliteDatabase() {
    if (db_) sqlite3_close(db_);
}

void SqliteDatabase::put_locked(const Bytes& key, const Bytes& value) {
    Stmt st;
    prepare(db_, st, "INSERT OR REPLACE INTO kv(key, value) VALUES(?, ?);");
    bind_blob(db_, st, 1, key);
    bind_blob(db_, st, 2, value);
    check_sql(sqlite3_step(st.s), db_, "put");
}

void SqliteDatabase::del_locked(const Bytes& key) {
    Stmt st;
    prepare(db_, st, "DELETE FROM kv WHERE key = ?;");
    bind_blob(db_, st, 1, key);
    check_sql(sqlite3_step(st.s), db_, "del");
}

bool SqliteDatabase::put(const Bytes& key, const Bytes& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        put_locked(key, value);
        return true;
    } catch (const PersistenceError& e) {
        std::cerr << "[storage] Put failed path=" << path_ << " error=" << e.what() << std::endl;
        return false;
    }
}

std::optional<Bytes> SqliteDatabase::get(const Bytes& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Stmt st;
    prepare(db_, st, "SELECT value FROM kv WHERE key = ?;");
    bind_blob(db_, st, 1, key);
    int rc = sqlite3_step(st.s);
    check_sql(rc, db_, "get");
    if (rc != SQLITE_ROW) {
        return std::nullopt;
    }
    return column_blob(st, 0);
}

bool SqliteDatabase::del(const Bytes& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        del_locked(key);
        return sqlite3_changes(db_) > 0;
    } catch (const PersistenceError& e) {
        std::cerr << "[storage] Delete failed path=" << path_ << " error=" << e.what() << std::endl;
        return false;
    }
}

bool SqliteDatabase::exists(const Bytes& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Stmt st;
    prepare(db_, st, "SELECT 1 FROM kv WHERE key = ?;");
    bind_blob(db_, st, 1, key);
    int rc = sqlite3_step(st.s);
    check_sql(rc, db_, "exists");
    return rc == SQLITE_ROW;
}

bool SqliteDatabase::write_batch(const WriteBatch& batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        exec_sql(db_, "BEGIN IMMEDIATE;");
    } catch (const PersistenceError& e) {
        std::cerr << "[storage] Batch begin failed path=" << path_ << " error=" << e.what() << std::endl;
        return false;
    }
    try {
        for (const auto& [key, value] : batch.puts) put_locked(key, value);
        for (const auto& key : batch.deletes) del_locked(key);
        exec_sql(db_, "COMMIT;");
        return true;
    } catch (const PersistenceError& e) {
        std::cerr << "[storage] Batch failed, rolling back path=" << path_
                  << " ops=" << batch.size() << " error=" << e.what() << std::endl;
        if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
            std::cerr << "[storage] Rollback failed path=" << path_ << " error=" << sqlite3_errmsg(db_) << std::endl;
        }
        return false;
    }
}

std::unique_ptr<Database::Iterator> SqliteDatabase::new_iterator(const Bytes& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    Stmt st;
    prepare(db_, st, "SELECT key, value FROM kv WHERE key >= ? ORDER BY key;");
    bind_blob(db_, st, 1, prefix);

    std::vector<std::pair<Bytes, Bytes>> entries;
    int rc;
    while ((rc = sqlite3_step(st.s)) == SQLITE_ROW) {
        Bytes key = column_blob(st, 0);
        if (!has_prefix(key, prefix)) {
            break;
        }
        entries.emplace_back(std::move(key), column_blob(st, 1));
    }
    check_sql(rc, db_, "scan");
    return std::make_unique<SnapshotIterator>(std::move(entries));
}

// ============================================================================
// PrefixedDatabase
// ============================================================================

PrefixedDatabase::PrefixedDatabase(std::shared_ptr<Database> base, const std::string& prefix)
    : base_(std::move(base)), prefix_(to_key(prefix)) {}

Bytes PrefixedDatabase::full_key(const Bytes& key) const {
    Bytes full = prefix_;
    full.insert(full.end(), key.begin(), key.end());
    return full;
}

bool PrefixedDatabase::put(const Bytes& key, const Bytes& value) {
    return base_->put(full_key(key), value);
}

std::optional<Bytes> PrefixedDatabase::get(const Bytes& key) {
    return base_->get(full_key(key));
}

bool PrefixedDatabase::del(const Bytes& key) {
    return base_->del(full_key(key));
}

bool PrefixedDatabase::exists(const Bytes& key) {
    return base_->exists(full_key(key));
}

bool PrefixedDatabase::write_batch(const WriteBatch& batch) {
    WriteBatch prefixed;
    for (const auto& [key, value] : batch.puts) prefixed.put(full_key(key), value);
    for (const auto& key : batch.deletes) prefixed.del(full_key(key));
    return base_->write_batch(prefixed);
}

std::unique_ptr<Database::Iterator> PrefixedDatabase::new_iterator(const Bytes& prefix) {
    // Strip our prefix again so callers see their own key space
    std::vector<std::pair<Bytes, Bytes>> entries;
    auto it = base_->new_iterator(full_key(prefix));
    for (; it->valid(); it->next()) {
        Bytes key = it->key();
        entries.emplace_back(Bytes(key.begin() + static_cast<std::ptrdiff_t>(prefix_.size()), key.end()),
                             it->value());
    }
    return std::make_unique<SnapshotIterator>(std::move(entries));
}

} // namespace storage
} // namespace stark_sync
