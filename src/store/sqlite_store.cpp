#include "sqlite_store.hpp"
#include "../store_registry.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <stdexcept>

static finly::StoreRegistrar reg_sqlite("sqlite",
    [](const finly::Config& config) {
        return std::make_unique<finly::SqliteStore>(config.store_path());
    });

namespace finly {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

SqliteStore::SqliteStore(const std::string& path) : path_(path) {
    // Ensure parent directory exists
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw std::runtime_error("SqliteStore: failed to open database: " + err);
    }

    sqlite3_busy_timeout(db_, 2000);
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    init_schema();
}

SqliteStore::~SqliteStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteStore::fail(const std::string& what) const {
    throw std::runtime_error("SqliteStore: " + what + ": " + sqlite3_errmsg(db_));
}

void SqliteStore::init_schema() {
    const char* create_table =
        "CREATE TABLE IF NOT EXISTS kv ("
        "  key        TEXT PRIMARY KEY,"
        "  value      TEXT NOT NULL,"
        "  updated_at INTEGER NOT NULL"
        ");";
    if (sqlite3_exec(db_, create_table, nullptr, nullptr, nullptr) != SQLITE_OK) {
        fail("failed to create schema");
    }
}

std::optional<std::string> SqliteStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    if (sqlite3_prepare_v2(db_, "SELECT value FROM kv WHERE key = ?1;",
                           -1, &g.stmt, nullptr) != SQLITE_OK) {
        fail("prepare get");
    }
    sqlite3_bind_text(g.stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(g.stmt);
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) fail("get");

    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(g.stmt, 0));
    int len = sqlite3_column_bytes(g.stmt, 0);
    return std::string(text ? text : "", static_cast<size_t>(len));
}

void SqliteStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    const char* sql =
        "INSERT INTO kv (key, value, updated_at) "
        "VALUES (?1, ?2, strftime('%s','now')) "
        "ON CONFLICT(key) DO UPDATE SET value = excluded.value, "
        "updated_at = excluded.updated_at;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        fail("prepare set");
    }
    sqlite3_bind_text(g.stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 2, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);

    if (sqlite3_step(g.stmt) != SQLITE_DONE) fail("set");
}

bool SqliteStore::remove_locked(const std::string& key) {
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, "DELETE FROM kv WHERE key = ?1;",
                           -1, &g.stmt, nullptr) != SQLITE_OK) {
        fail("prepare remove");
    }
    sqlite3_bind_text(g.stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) fail("remove");
    return sqlite3_changes(db_) > 0;
}

bool SqliteStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return remove_locked(key);
}

size_t SqliteStore::remove_many(const std::vector<std::string>& keys) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (keys.empty()) return 0;

    sqlite3_exec(db_, "BEGIN;", nullptr, nullptr, nullptr);
    size_t removed = 0;
    try {
        for (const auto& key : keys) {
            if (remove_locked(key)) ++removed;
        }
    } catch (const std::runtime_error&) {
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
    sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, nullptr);
    return removed;
}

std::vector<std::string> SqliteStore::keys_with_prefix(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);

    // substr() comparison instead of LIKE: keys may contain % and _.
    StmtGuard g;
    const char* sql =
        "SELECT key FROM kv WHERE substr(key, 1, length(?1)) = ?1 ORDER BY key;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        fail("prepare keys_with_prefix");
    }
    sqlite3_bind_text(g.stmt, 1, prefix.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<std::string> keys;
    int rc;
    while ((rc = sqlite3_step(g.stmt)) == SQLITE_ROW) {
        const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(g.stmt, 0));
        if (text) keys.emplace_back(text);
    }
    if (rc != SQLITE_DONE) fail("keys_with_prefix");
    return keys;
}

} // namespace finly
