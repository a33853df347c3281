#pragma once
#include <string>
#include <vector>
#include <optional>
#include <memory>

namespace finly {

struct Config; // forward declaration

// Durable string key/value storage shared by the token manager and the
// response cache. Only per-key atomicity is required. Backends throw
// std::runtime_error on I/O failure.
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual std::string backend_name() const = 0;

    virtual std::optional<std::string> get(const std::string& key) = 0;

    // Create or overwrite.
    virtual void set(const std::string& key, const std::string& value) = 0;

    // Returns true if the key existed.
    virtual bool remove(const std::string& key) = 0;

    // Returns the number of keys that existed.
    virtual size_t remove_many(const std::vector<std::string>& keys) = 0;

    // All keys starting with `prefix`, in lexicographic order.
    virtual std::vector<std::string> keys_with_prefix(const std::string& prefix) = 0;
};

// Create the backend named by config.store.backend ("sqlite" or "json").
std::unique_ptr<KeyValueStore> create_store(const Config& config);

} // namespace finly
