#pragma once
#include "cache_policy.hpp"
#include "config.hpp"
#include "store.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <cstdint>

namespace finly {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Deterministic cache key: normalized path plus key-sorted, percent-encoded
// query parameters. Parameters embedded in `path` are merged in, so
// "/a?y=2&x=1" and ("a", {{"x","1"},{"y","2"}}) collide. Embedded values
// are percent-decoded first, so "a?q=x%20y" matches ("a", {{"q","x y"}}).
std::string make_cache_key(const std::string& path, const QueryParams& params = {});

enum class Freshness { Fresh, Stale, Miss };

struct CacheLookup {
    Freshness freshness = Freshness::Miss;
    nlohmann::json payload;
    uint64_t age_ms = 0;
};

struct CacheEntry {
    std::string key;
    nlohmann::json payload;
    uint64_t stored_at = 0;   // epoch ms
};

// Read-through response cache with stale-while-revalidate bookkeeping,
// persisted in a KeyValueStore under the "cache:" namespace. Performs no
// network I/O. Store failures are logged and degrade to misses.
class CacheStore {
public:
    using Clock = std::function<uint64_t()>; // epoch milliseconds

    static constexpr const char* kKeyPrefix = "cache:";

    CacheStore(KeyValueStore& store, CacheConfig config, Clock clock = nullptr);

    // age <= fresh -> Fresh; fresh < age <= stale -> Stale; otherwise Miss.
    static Freshness classify(uint64_t age_ms, const CacheTtl& ttl);

    CacheLookup get(const std::string& key, const CacheTtl& ttl);

    // Same, with the endpoint TTL derived from the key's path.
    CacheLookup get(const std::string& key);

    // Entry regardless of age. Used for the rate-limit fallback.
    std::optional<CacheEntry> peek(const std::string& key);

    // Create or overwrite with stored_at = now.
    void set(const std::string& key, const nlohmann::json& payload);

    // Like set(), but skipped if any invalidation or clear happened after
    // `generation` was read. Returns whether the entry was written.
    bool set_if_current(const std::string& key, const nlohmann::json& payload,
                        uint64_t generation);

    // Delete every entry whose key starts with `prefix`. Returns the count.
    size_t invalidate(const std::string& prefix);

    void clear();

    // Bumped by every invalidate() and clear().
    uint64_t generation() const;

    size_t size() const;

    const CacheConfig& config() const { return config_; }

private:
    void load_index();
    void write_locked(const std::string& key, const nlohmann::json& payload);
    void evict_locked();
    size_t remove_locked(const std::vector<std::string>& keys);

    KeyValueStore& store_;
    CacheConfig config_;
    Clock clock_;
    std::map<std::string, uint64_t> index_;   // cache key -> stored_at
    uint64_t generation_ = 0;
    mutable std::mutex mutex_;
};

} // namespace finly
