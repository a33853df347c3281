#pragma once
#include "config.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace finly {

struct CacheTtl {
    uint64_t fresh_ms = 0;
    uint64_t stale_ms = 0;
};

// Static policy tables tying endpoints to cache lifetimes, mutation
// invalidation and background revalidation. Paths are normalized (no
// leading slash) before lookup.
namespace cache_policy {

// TTL for a GET path: the longest matching endpoint override, else the
// configured defaults. fresh_ms <= stale_ms always holds.
CacheTtl ttl_for(const std::string& path, const CacheConfig& defaults);

// First path segment: "expenses/42" -> "expenses".
std::string resource_of(const std::string& path);

// Cache-key prefixes to drop after a successful mutation on `path`.
// Unmapped resources invalidate their own prefix.
std::vector<std::string> invalidation_prefixes(const std::string& path);

// Whether a stale hit on `path` may launch a background refresh.
bool revalidation_eligible(const std::string& path);

// Auth endpoints that must never go through refresh-and-replay.
bool is_public_endpoint(const std::string& path);

} // namespace cache_policy

} // namespace finly
