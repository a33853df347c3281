#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace finly {

// Upper bounds applied by Config::from_json.
constexpr uint32_t kMaxRetriesLimit = 10;
constexpr uint32_t kBaseDelayLimitMs = 60000;

struct RetryConfig {
    uint32_t max_retries = 3;          // read operations: 1 + max_retries attempts
    uint32_t base_delay_ms = 1000;
    double backoff_multiplier = 2.0;
};

struct CacheConfig {
    bool enabled = true;
    uint64_t ttl_fresh_ms = 300000;    // 5 minutes
    uint64_t ttl_stale_ms = 600000;    // 10 minutes
    uint32_t max_entries = 100;
    bool stale_while_revalidate = true;
};

struct StoreConfig {
    std::string backend = "sqlite";
    std::string path;                  // empty = ~/.finly/store.<ext>
};

struct Config {
    std::string base_url = "https://api.finly.app";
    std::string api_version = "v1";
    long timeout_seconds = 30;

    RetryConfig retry;
    CacheConfig cache;
    StoreConfig store;

    // Load from ~/.finly/config.json + env vars
    static Config load();

    // Load from an explicit file; the file is created or migrated with
    // missing defaults. Env vars still override.
    static Config load_from(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse a config JSON object. Unknown or mistyped fields are ignored.
    static Config from_json(const nlohmann::json& j);

    // <base_url>/api/<api_version>/<path>
    std::string api_url(const std::string& path) const;

    // Store file path with the default for the configured backend applied.
    std::string store_path() const;
};

} // namespace finly
