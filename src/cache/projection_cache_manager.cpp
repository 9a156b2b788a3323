#include "cache/projection_cache_manager.h"
#include "utils/logger.h"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <boost/regex.hpp>
#include <openssl/evp.h>

namespace prism {
namespace cache {

using json = nlohmann::ordered_json;

namespace {

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

void appendEscaped(std::string& regex, const std::string& literal) {
    static const std::string special = R"(.^$|()[]{}*+?\)";
    for (char c : literal) {
        if (special.find(c) != std::string::npos) {
            regex += '\\';
        }
        regex += c;
    }
}

bool isAsciiLetter(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool isAsciiDigit(char c) {
    return c >= '0' && c <= '9';
}

// Next "{name}" at or after pos; "{}" is not a placeholder. Returns npos pair when none.
std::pair<size_t, size_t> findPlaceholder(const std::string& pattern, size_t pos) {
    size_t open = pattern.find('{', pos);
    while (open != std::string::npos) {
        size_t close = pattern.find('}', open + 1);
        if (close == std::string::npos) {
            break;
        }
        if (close > open + 1) {
            return {open, close};
        }
        open = pattern.find('{', close + 1);
    }
    return {std::string::npos, std::string::npos};
}

} // namespace

// ============================================================================
// Lifecycle
// ============================================================================

ProjectionCacheManager::ProjectionCacheManager(config::ProjectionConfig::CacheConfig config)
    : config_(std::move(config)) {
    entries_.reserve(std::min<size_t>(config_.max_entries, 1024));
    PRISM_INFO("Projection cache initialized: enabled={}, default_ttl={}s, collection_ttl={}s, "
               "hard_ttl={}s, max_entries={}",
               config_.enabled, config_.default_ttl_seconds, config_.collection_ttl_seconds,
               config_.effectiveHardTtlSeconds(), config_.max_entries);
}

// ============================================================================
// Lookup / store
// ============================================================================

ProjectionCacheManager::EntryPtr ProjectionCacheManager::get(const CacheKey& key) {
    if (!config_.enabled) {
        return nullptr;
    }

    EntryPtr entry;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(key.getKey());
        if (it != entries_.end()) {
            entry = it->second.entry;
        }
    }

    if (!entry) {
        misses_++;
        PRISM_DEBUG("Cache miss: {}", key.getKey());
        return nullptr;
    }

    if (entry->isExpired()) {
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            auto it = entries_.find(key.getKey());
            // Only drop the instance we saw; a concurrent put may have replaced it
            if (it != entries_.end() && it->second.entry == entry) {
                entries_.erase(it);
                expirations_++;
            }
        }
        misses_++;
        PRISM_DEBUG("Cache entry expired: {}", key.getKey());
        return nullptr;
    }

    hits_++;
    PRISM_DEBUG("Cache hit: {}", key.getKey());
    return entry;
}

ProjectionCacheManager::EntryPtr ProjectionCacheManager::put(const CacheKey& key, json response,
                                                             int ttl_seconds, bool is_collection,
                                                             const std::string& content_type) {
    if (!config_.enabled) {
        return nullptr;
    }

    const int effective_ttl = effectiveTtlSeconds(ttl_seconds, is_collection);
    const TimePoint now = Clock::now();

    auto builder = CachedResponse::builder();
    builder.cachedAt(now).ttl(std::chrono::seconds(effective_ttl)).contentType(content_type);

    if (config_.conditional.enabled) {
        builder.etag(generateEtag(response))
               .lastModified(std::chrono::time_point_cast<std::chrono::seconds>(now));
    }
    EntryPtr entry = builder.fullResponse(std::move(response)).build();

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(key.getKey());
        if (it != entries_.end()) {
            it->second.entry = entry;
        } else {
            if (entries_.size() >= config_.max_entries) {
                makeRoomLocked(now);
            }
            entries_.emplace(key.getKey(), Slot{key, entry});
        }
    }

    puts_++;
    PRISM_DEBUG("Cached response: {} (TTL: {}s)", key.getKey(), effective_ttl);
    return entry;
}

ProjectionCacheManager::EntryPtr ProjectionCacheManager::findLive(const CacheKey& key) const {
    if (!config_.enabled) {
        return nullptr;
    }
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(key.getKey());
    if (it == entries_.end() || it->second.entry->isExpired()) {
        return nullptr;
    }
    return it->second.entry;
}

int ProjectionCacheManager::effectiveTtlSeconds(int ttl_seconds, bool is_collection) const {
    int ttl = ttl_seconds > 0 ? ttl_seconds
            : (is_collection ? config_.collection_ttl_seconds : config_.default_ttl_seconds);
    return std::min(ttl, config_.effectiveHardTtlSeconds());
}

void ProjectionCacheManager::makeRoomLocked(TimePoint now) {
    size_t purged = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.entry->isExpired(now)) {
            it = entries_.erase(it);
            ++purged;
        } else {
            ++it;
        }
    }
    expirations_ += purged;

    if (entries_.size() < config_.max_entries || entries_.empty()) {
        return;
    }

    auto victim = std::min_element(entries_.begin(), entries_.end(),
        [](const auto& a, const auto& b) {
            return a.second.entry->getExpiresAt() < b.second.entry->getExpiresAt();
        });
    PRISM_DEBUG("Cache full ({} entries), dropping {}", entries_.size(), victim->first);
    entries_.erase(victim);
    evictions_++;
}

// ============================================================================
// Conditional validators
// ============================================================================

bool ProjectionCacheManager::validateEtag(const CacheKey& key, const std::string& client_etag) {
    if (!config_.conditional.enabled || trim(client_etag).empty()) {
        return false;
    }
    auto entry = findLive(key);
    if (!entry || !entry->getEtag()) {
        return false;
    }
    return matchesEtag(*entry->getEtag(), client_etag);
}

bool ProjectionCacheManager::matchesEtag(const std::string& server_etag, const std::string& if_none_match) {
    std::string header = trim(if_none_match);
    if (header == "*") {
        return true;
    }
    std::stringstream ss(header);
    std::string candidate;
    while (std::getline(ss, candidate, ',')) {
        auto normalized = normalizeEtag(candidate);
        if (normalized && *normalized == server_etag) {
            return true;
        }
    }
    return false;
}

bool ProjectionCacheManager::validateLastModified(const CacheKey& key, TimePoint client_last_modified) {
    if (!config_.conditional.enabled) {
        return false;
    }
    auto entry = findLive(key);
    if (!entry || !entry->getLastModified()) {
        return false;
    }
    return client_last_modified >= *entry->getLastModified();
}

std::string ProjectionCacheManager::generateEtag(const json& response) {
    // Backend strings are not guaranteed to be valid UTF-8; the default strict handler would throw
    const std::string body = response.dump(-1, ' ', false, json::error_handler_t::replace);

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(body.data(), body.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(sha256) failed while computing ETag");
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < digest_len; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return oss.str();
}

std::optional<std::string> ProjectionCacheManager::normalizeEtag(const std::string& etag) {
    std::string normalized = trim(etag);
    if (normalized.empty()) {
        return std::nullopt;
    }

    // Weak validator prefix
    if (normalized.size() >= 2 && normalized[0] == 'W' && normalized[1] == '/') {
        normalized = trim(normalized.substr(2));
    }

    if (normalized.size() >= 2 && normalized.front() == '"' && normalized.back() == '"') {
        normalized = normalized.substr(1, normalized.size() - 2);
    }
    return normalized;
}

// ============================================================================
// Eviction
// ============================================================================

bool ProjectionCacheManager::evict(const CacheKey& key) {
    if (!config_.enabled) {
        return false;
    }
    size_t removed = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        removed = entries_.erase(key.getKey());
    }
    if (removed > 0) {
        evictions_ += removed;
        PRISM_DEBUG("Evicted cache entry: {}", key.getKey());
    }
    return removed > 0;
}

size_t ProjectionCacheManager::evictByPathPattern(const std::string& path_pattern) {
    if (!config_.enabled || !config_.manual_eviction.enabled) {
        return 0;
    }

    const std::string normalized = CacheKey::normalizePath(path_pattern);

    if (findPlaceholder(normalized, 0).first == std::string::npos) {
        size_t removed = 0;
        for (const char* method : {"GET", "HEAD"}) {
            if (evict(CacheKey::of(method, normalized))) ++removed;
        }
        return removed;
    }

    boost::regex compiled;
    const std::string source = buildPathRegex(normalized);
    try {
        compiled.assign(source, boost::regex::perl);
    } catch (const boost::regex_error& e) {
        PRISM_ERROR("Invalid eviction pattern '{}' (regex '{}'): {}", path_pattern, source, e.what());
        throw std::invalid_argument("invalid eviction path pattern: " + path_pattern);
    }

    size_t removed = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (boost::regex_match(it->second.key.getPath(), compiled)) {
                PRISM_DEBUG("Evicted by pattern '{}': {}", path_pattern, it->first);
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    evictions_ += removed;
    return removed;
}

void ProjectionCacheManager::evictAll() {
    size_t removed = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        removed = entries_.size();
        entries_.clear();
    }
    evictions_ += removed;
    PRISM_DEBUG("Evicted all cache entries ({})", removed);
}

std::string ProjectionCacheManager::buildPathRegex(const std::string& path_pattern) {
    std::string regex = "^";
    std::vector<std::string> used_names;
    size_t pos = 0;

    while (pos < path_pattern.size()) {
        auto [open, close] = findPlaceholder(path_pattern, pos);
        if (open == std::string::npos) {
            break;
        }

        appendEscaped(regex, path_pattern.substr(pos, open - pos));

        auto name = sanitizeGroupName(path_pattern.substr(open + 1, close - open - 1));
        if (name) {
            // Repeated names get a numeric suffix so every capture stays addressable
            std::string unique = *name;
            int n = 2;
            while (std::find(used_names.begin(), used_names.end(), unique) != used_names.end()) {
                unique = *name + std::to_string(n++);
            }
            used_names.push_back(unique);
            regex += "(?<" + unique + ">[^/]+)";
        } else {
            regex += "([^/]+)";
        }
        pos = close + 1;
    }

    if (pos < path_pattern.size()) {
        appendEscaped(regex, path_pattern.substr(pos));
    }
    regex += "$";
    return regex;
}

std::optional<std::string> ProjectionCacheManager::sanitizeGroupName(const std::string& name) {
    std::string sanitized;
    for (char c : name) {
        if (isAsciiLetter(c) || isAsciiDigit(c)) {
            sanitized += c;
        }
    }
    if (sanitized.empty()) {
        return std::nullopt;
    }
    if (!isAsciiLetter(sanitized.front())) {
        sanitized.insert(sanitized.begin(), 'p');
    }
    return sanitized;
}

// ============================================================================
// Introspection
// ============================================================================

size_t ProjectionCacheManager::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

ProjectionCacheManager::Stats ProjectionCacheManager::getStats() const {
    Stats stats;
    stats.hits = hits_.load();
    stats.misses = misses_.load();
    stats.puts = puts_.load();
    stats.evictions = evictions_.load();
    stats.expirations = expirations_.load();
    stats.entries = size();
    return stats;
}

json ProjectionCacheManager::Stats::toJson() const {
    uint64_t lookups = hits + misses;
    return {
        {"hits", hits},
        {"misses", misses},
        {"puts", puts},
        {"evictions", evictions},
        {"expirations", expirations},
        {"entries", entries},
        {"hit_rate", lookups > 0 ? static_cast<double>(hits) / static_cast<double>(lookups) : 0.0}
    };
}

} // namespace cache
} // namespace prism
