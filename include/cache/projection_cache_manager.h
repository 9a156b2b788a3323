#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

#include "cache/cache_key.h"
#include "cache/cached_response.h"
#include "config/projection_config.h"

namespace prism {
namespace cache {

/**
 * @brief In-memory store of full responses keyed by CacheKey
 *
 * Features:
 * - Per-entry TTL (endpoint override, default or collection TTL) capped by a
 *   hard TTL
 * - Bounded size; expired entries are purged first, then the entry closest
 *   to expiry
 * - ETag (SHA-256 of the compact JSON) and Last-Modified validators
 * - Single-key, path-pattern and full eviction
 * - Thread-safe: callers never lock
 *
 * One instance per process, constructed and owned by the application and
 * passed by reference to the pipeline and invalidator.
 */
class ProjectionCacheManager {
public:
    using Clock = CachedResponse::Clock;
    using TimePoint = CachedResponse::TimePoint;
    using EntryPtr = std::shared_ptr<const CachedResponse>;

    explicit ProjectionCacheManager(config::ProjectionConfig::CacheConfig config = {});

    ProjectionCacheManager(const ProjectionCacheManager&) = delete;
    ProjectionCacheManager& operator=(const ProjectionCacheManager&) = delete;

    /**
     * @brief Look up a live entry
     *
     * Expired entries are removed and reported as absent.
     * @return nullptr on miss, expiry or when caching is disabled
     */
    EntryPtr get(const CacheKey& key);

    /**
     * @brief Store the full response
     *
     * @param ttl_seconds Endpoint override; <= 0 selects the configured default
     *                    (or the collection TTL when is_collection)
     * @param content_type Media type replayed on every hit
     * @return The stored entry, or nullptr when caching is disabled
     */
    EntryPtr put(const CacheKey& key, nlohmann::ordered_json response, int ttl_seconds = -1,
                 bool is_collection = false, const std::string& content_type = "application/json");

    /**
     * @brief Compare a client If-None-Match value with the stored ETag
     *
     * Accepts quoted, unquoted and weak ("W/") forms, comma-separated lists
     * and "*". Validator lookups do not count as cache hits or misses.
     */
    bool validateEtag(const CacheKey& key, const std::string& client_etag);

    /**
     * @brief True if the client copy is not older than the stored Last-Modified
     */
    bool validateLastModified(const CacheKey& key, TimePoint client_last_modified);

    // True if an entry was removed
    bool evict(const CacheKey& key);

    /**
     * @brief Evict entries by path template
     *
     * "/users/{id}" evicts every cached /users/<segment> regardless of method,
     * query or user. A template without placeholders evicts only the exact
     * GET and HEAD entries for that path.
     *
     * @return Number of entries removed
     */
    size_t evictByPathPattern(const std::string& path_pattern);

    void evictAll();

    size_t size() const;

    int effectiveTtlSeconds(int ttl_seconds, bool is_collection) const;

    const config::ProjectionConfig::CacheConfig& getConfig() const { return config_; }

    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t puts = 0;
        uint64_t evictions = 0;
        uint64_t expirations = 0;
        size_t entries = 0;

        nlohmann::ordered_json toJson() const;
    };
    Stats getStats() const;

    // Hex SHA-256 of the compact serialization; invalid UTF-8 is replaced by U+FFFD
    static std::string generateEtag(const nlohmann::ordered_json& response);

    // If-None-Match semantics against a known server tag
    static bool matchesEtag(const std::string& server_etag, const std::string& if_none_match);

    // Strip whitespace, weak prefix and quotes; nullopt for blank input
    static std::optional<std::string> normalizeEtag(const std::string& etag);

    // Anchored regex source for a path template, e.g. "^/users/(?<id>[^/]+)$"
    static std::string buildPathRegex(const std::string& path_pattern);

    // ASCII letters/digits only, starting with a letter; nullopt if nothing survives
    static std::optional<std::string> sanitizeGroupName(const std::string& name);

private:
    struct Slot {
        CacheKey key;
        EntryPtr entry;
    };

    void makeRoomLocked(TimePoint now);

    // Live entry without touching hit/miss counters or removing expired slots
    EntryPtr findLive(const CacheKey& key) const;

    config::ProjectionConfig::CacheConfig config_;

    std::unordered_map<std::string, Slot> entries_;
    mutable std::shared_mutex mutex_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> puts_{0};
    std::atomic<uint64_t> evictions_{0};
    std::atomic<uint64_t> expirations_{0};
};

} // namespace cache
} // namespace prism
