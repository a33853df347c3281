#pragma once
#include "../store.hpp"
#include <map>
#include <mutex>
#include <string>

namespace finly {

// Whole-file JSON object backend. Every mutation rewrites the file
// atomically; intended for small stores and debugging.
class JsonStore : public KeyValueStore {
public:
    explicit JsonStore(const std::string& path);

    std::string backend_name() const override { return "json"; }

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value) override;
    bool remove(const std::string& key) override;
    size_t remove_many(const std::vector<std::string>& keys) override;
    std::vector<std::string> keys_with_prefix(const std::string& prefix) override;

private:
    void load();
    void save();
    void commit(std::map<std::string, std::string> next);

    std::string path_;
    std::map<std::string, std::string> entries_;
    std::mutex mutex_;
};

} // namespace finly
