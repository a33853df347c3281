#pragma once
#include "../store.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace finly {

// Single-table SQLite backend. Default store: survives restarts and keeps
// per-key writes atomic without rewriting the whole file.
class SqliteStore : public KeyValueStore {
public:
    explicit SqliteStore(const std::string& path);
    ~SqliteStore() override;

    // Non-copyable
    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    std::string backend_name() const override { return "sqlite"; }

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value) override;
    bool remove(const std::string& key) override;
    size_t remove_many(const std::vector<std::string>& keys) override;
    std::vector<std::string> keys_with_prefix(const std::string& prefix) override;

private:
    void init_schema();
    bool remove_locked(const std::string& key);
    [[noreturn]] void fail(const std::string& what) const;

    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace finly
