#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

namespace finly {

nlohmann::json Config::defaults_json() {
    return {
        {"base_url", "https://api.finly.app"},
        {"api_version", "v1"},
        {"timeout_seconds", 30},
        {"retry", {
            {"max_retries", 3},
            {"base_delay_ms", 1000},
            {"backoff_multiplier", 2.0}
        }},
        {"cache", {
            {"enabled", true},
            {"ttl_fresh_ms", 300000},
            {"ttl_stale_ms", 600000},
            {"max_entries", 100},
            {"stale_while_revalidate", true}
        }},
        {"store", {
            {"backend", "sqlite"},
            {"path", ""}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static bool non_negative_int(const nlohmann::json& v) {
    return v.is_number_integer() && (v.is_number_unsigned() || v.get<int64_t>() >= 0);
}

// Reads a non-negative integer, capped at `limit` with a [config] warning.
static uint64_t bounded(const nlohmann::json& v, const char* name, uint64_t limit) {
    uint64_t n = v.get<uint64_t>();
    if (n > limit) {
        std::cerr << "[config] " << name << " = " << n << " exceeds " << limit
                  << "; clamping\n";
        n = limit;
    }
    return n;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("base_url") && j["base_url"].is_string())
        cfg.base_url = j["base_url"].get<std::string>();
    if (j.contains("api_version") && j["api_version"].is_string())
        cfg.api_version = j["api_version"].get<std::string>();
    if (j.contains("timeout_seconds") && non_negative_int(j["timeout_seconds"]))
        cfg.timeout_seconds = j["timeout_seconds"].get<long>();

    if (j.contains("retry") && j["retry"].is_object()) {
        auto& r = j["retry"];
        if (r.contains("max_retries") && non_negative_int(r["max_retries"]))
            cfg.retry.max_retries = static_cast<uint32_t>(
                bounded(r["max_retries"], "retry.max_retries", kMaxRetriesLimit));
        if (r.contains("base_delay_ms") && non_negative_int(r["base_delay_ms"]))
            cfg.retry.base_delay_ms = static_cast<uint32_t>(
                bounded(r["base_delay_ms"], "retry.base_delay_ms", kBaseDelayLimitMs));
        if (r.contains("backoff_multiplier") && r["backoff_multiplier"].is_number())
            cfg.retry.backoff_multiplier = r["backoff_multiplier"].get<double>();
    }

    if (j.contains("cache") && j["cache"].is_object()) {
        auto& c = j["cache"];
        if (c.contains("enabled") && c["enabled"].is_boolean())
            cfg.cache.enabled = c["enabled"].get<bool>();
        if (c.contains("ttl_fresh_ms") && non_negative_int(c["ttl_fresh_ms"]))
            cfg.cache.ttl_fresh_ms = c["ttl_fresh_ms"].get<uint64_t>();
        if (c.contains("ttl_stale_ms") && non_negative_int(c["ttl_stale_ms"]))
            cfg.cache.ttl_stale_ms = c["ttl_stale_ms"].get<uint64_t>();
        if (c.contains("max_entries") && non_negative_int(c["max_entries"]))
            cfg.cache.max_entries = static_cast<uint32_t>(
                bounded(c["max_entries"], "cache.max_entries", UINT32_MAX));
        if (c.contains("stale_while_revalidate") && c["stale_while_revalidate"].is_boolean())
            cfg.cache.stale_while_revalidate = c["stale_while_revalidate"].get<bool>();
    }

    if (j.contains("store") && j["store"].is_object()) {
        auto& s = j["store"];
        if (s.contains("backend") && s["backend"].is_string())
            cfg.store.backend = s["backend"].get<std::string>();
        if (s.contains("path") && s["path"].is_string())
            cfg.store.path = s["path"].get<std::string>();
    }

    if (cfg.retry.backoff_multiplier < 1.0) cfg.retry.backoff_multiplier = 1.0;

    // A fresh window longer than the stale window would make "stale" unreachable.
    if (cfg.cache.ttl_fresh_ms > cfg.cache.ttl_stale_ms) {
        std::cerr << "[config] cache.ttl_fresh_ms exceeds cache.ttl_stale_ms; clamping\n";
        cfg.cache.ttl_fresh_ms = cfg.cache.ttl_stale_ms;
    }

    return cfg;
}

Config Config::load() {
    return load_from(expand_home("~/.finly/config.json"));
}

Config Config::load_from(const std::string& config_path) {
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("FINLY_BASE_URL"))
        cfg.base_url = trim(v);
    if (const char* v = std::getenv("FINLY_API_VERSION"))
        cfg.api_version = trim(v);
    if (const char* v = std::getenv("FINLY_TIMEOUT")) {
        try {
            long t = std::stol(v);
            if (t > 0) cfg.timeout_seconds = t;
        } catch (const std::exception&) {
            std::cerr << "[config] Ignoring invalid FINLY_TIMEOUT: " << v << "\n";
        }
    }
    if (const char* v = std::getenv("FINLY_STORE_PATH"))
        cfg.store.path = trim(v);

    return cfg;
}

std::string Config::api_url(const std::string& path) const {
    std::string base = base_url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + "/api/" + api_version + "/" + normalize_path(path);
}

std::string Config::store_path() const {
    if (!store.path.empty()) return expand_home(store.path);
    if (store.backend == "json") return expand_home("~/.finly/store.json");
    return expand_home("~/.finly/store.db");
}

} // namespace finly
