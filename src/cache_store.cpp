#include "cache_store.hpp"
#include "util.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace finly {

using json = nlohmann::json;

std::string make_cache_key(const std::string& path, const QueryParams& params) {
    std::string p = path;
    QueryParams all = params;

    auto q = p.find('?');
    if (q != std::string::npos) {
        for (const auto& pair : split(p.substr(q + 1), '&')) {
            if (pair.empty()) continue;
            auto eq = pair.find('=');
            // Decoded so the re-encode below yields one canonical form.
            if (eq == std::string::npos) {
                all.emplace_back(url_decode(pair), "");
            } else {
                all.emplace_back(url_decode(pair.substr(0, eq)),
                                 url_decode(pair.substr(eq + 1)));
            }
        }
        p = p.substr(0, q);
    }

    std::string key = normalize_path(p);
    if (all.empty()) return key;

    std::sort(all.begin(), all.end());
    key += '?';
    for (size_t i = 0; i < all.size(); ++i) {
        if (i > 0) key += '&';
        key += url_encode(all[i].first) + '=' + url_encode(all[i].second);
    }
    return key;
}

CacheStore::CacheStore(KeyValueStore& store, CacheConfig config, Clock clock)
    : store_(store), config_(config), clock_(std::move(clock)) {
    if (!clock_) clock_ = epoch_millis;
    if (config_.ttl_fresh_ms > config_.ttl_stale_ms)
        config_.ttl_fresh_ms = config_.ttl_stale_ms;
    load_index();
}

void CacheStore::load_index() {
    const std::string ns(kKeyPrefix);
    try {
        for (const auto& store_key : store_.keys_with_prefix(ns)) {
            auto raw = store_.get(store_key);
            if (!raw) continue;
            try {
                json j = json::parse(*raw);
                index_[store_key.substr(ns.size())] = j.value("stored_at", uint64_t{0});
            } catch (const json::exception&) {
                store_.remove(store_key); // unreadable entry
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[cache] Failed to load cache index: " << e.what() << '\n';
    }
}

Freshness CacheStore::classify(uint64_t age_ms, const CacheTtl& ttl) {
    if (age_ms <= ttl.fresh_ms) return Freshness::Fresh;
    if (age_ms <= ttl.stale_ms) return Freshness::Stale;
    return Freshness::Miss;
}

CacheLookup CacheStore::get(const std::string& key) {
    return get(key, cache_policy::ttl_for(key, config_));
}

CacheLookup CacheStore::get(const std::string& key, const CacheTtl& ttl) {
    CacheLookup result;
    auto entry = peek(key);
    if (!entry) return result;

    uint64_t now = clock_();
    result.age_ms = now > entry->stored_at ? now - entry->stored_at : 0;
    result.freshness = classify(result.age_ms, ttl);
    // Expired entries stay in the store for the rate-limit fallback.
    if (result.freshness != Freshness::Miss) {
        result.payload = std::move(entry->payload);
    }
    return result;
}

std::optional<CacheEntry> CacheStore::peek(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index_.find(key) == index_.end()) return std::nullopt;

    try {
        auto raw = store_.get(kKeyPrefix + key);
        if (!raw) {
            index_.erase(key);
            return std::nullopt;
        }
        json j = json::parse(*raw);
        CacheEntry entry;
        entry.key = key;
        entry.payload = j.contains("data") ? j["data"] : json();
        entry.stored_at = j.value("stored_at", uint64_t{0});
        return entry;
    } catch (const std::exception& e) {
        std::cerr << "[cache] Read failed for " << key << ": " << e.what() << '\n';
        return std::nullopt;
    }
}

void CacheStore::write_locked(const std::string& key, const json& payload) {
    uint64_t now = clock_();
    json entry = {
        {"key", key},
        {"data", payload},
        {"stored_at", now}
    };
    try {
        store_.set(kKeyPrefix + key, entry.dump());
        index_[key] = now;
        evict_locked();
    } catch (const std::exception& e) {
        std::cerr << "[cache] Write failed for " << key << ": " << e.what() << '\n';
    }
}

void CacheStore::set(const std::string& key, const json& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    write_locked(key, payload);
}

bool CacheStore::set_if_current(const std::string& key, const json& payload,
                                uint64_t generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_) return false;
    write_locked(key, payload);
    return true;
}

void CacheStore::evict_locked() {
    if (config_.max_entries == 0 || index_.size() <= config_.max_entries) return;

    std::vector<std::pair<uint64_t, std::string>> by_age; // {stored_at, key}
    by_age.reserve(index_.size());
    for (const auto& [key, stored_at] : index_) {
        by_age.emplace_back(stored_at, key);
    }
    std::sort(by_age.begin(), by_age.end());

    size_t to_remove = index_.size() - config_.max_entries;
    std::vector<std::string> victims;
    victims.reserve(to_remove);
    for (size_t i = 0; i < to_remove; ++i) {
        victims.push_back(by_age[i].second);
    }
    remove_locked(victims);
}

size_t CacheStore::remove_locked(const std::vector<std::string>& keys) {
    if (keys.empty()) return 0;

    std::vector<std::string> store_keys;
    store_keys.reserve(keys.size());
    for (const auto& key : keys) {
        store_keys.push_back(kKeyPrefix + key);
    }
    store_.remove_many(store_keys);
    for (const auto& key : keys) {
        index_.erase(key);
    }
    return keys.size();
}

size_t CacheStore::invalidate(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++generation_;

    std::vector<std::string> victims;
    for (auto it = index_.lower_bound(prefix); it != index_.end(); ++it) {
        if (!starts_with(it->first, prefix)) break;
        victims.push_back(it->first);
    }

    try {
        return remove_locked(victims);
    } catch (const std::exception& e) {
        std::cerr << "[cache] Invalidate '" << prefix << "' failed: " << e.what() << '\n';
        // Forget the keys anyway so they cannot be served before restart.
        for (const auto& key : victims) index_.erase(key);
        return victims.size();
    }
}

void CacheStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++generation_;

    std::vector<std::string> all;
    all.reserve(index_.size());
    for (const auto& [key, _] : index_) {
        all.push_back(key);
    }
    try {
        remove_locked(all);
    } catch (const std::exception& e) {
        std::cerr << "[cache] Clear failed: " << e.what() << '\n';
    }
    index_.clear();
}

uint64_t CacheStore::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

size_t CacheStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.size();
}

} // namespace finly
