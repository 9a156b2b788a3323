#pragma once

#include <functional>
#include <optional>
#include <string>

namespace prism {
namespace cache {

/**
 * @brief Normalized identity of a cacheable request
 *
 * Format: METHOD:/path?sorted&query[@user]
 *
 * The method is uppercased, the path gets a leading slash and loses its
 * trailing slash (except for "/"), and query tokens are sorted so that
 * parameter order does not split the cache. Equality and hashing use only
 * the composed key string.
 */
class CacheKey {
public:
    CacheKey(const std::string& method, const std::string& path, const std::string& query_string,
             std::optional<std::string> user_context = std::nullopt);

    static CacheKey of(const std::string& method, const std::string& path, const std::string& query_string = "",
                       std::optional<std::string> user_context = std::nullopt) {
        return CacheKey(method, path, query_string, std::move(user_context));
    }

    const std::string& getKey() const { return key_; }
    const std::string& getMethod() const { return method_; }
    const std::string& getPath() const { return path_; }
    const std::string& getQuery() const { return query_; }
    const std::optional<std::string>& getUserContext() const { return user_context_; }

    bool operator==(const CacheKey& other) const { return key_ == other.key_; }
    bool operator!=(const CacheKey& other) const { return key_ != other.key_; }

    const std::string& toString() const { return key_; }

    static std::string normalizePath(const std::string& path);
    static std::string normalizeQuery(const std::string& query_string);

private:
    std::string method_;
    std::string path_;
    std::string query_;
    std::optional<std::string> user_context_;
    std::string key_;
};

} // namespace cache
} // namespace prism

namespace std {
template<>
struct hash<prism::cache::CacheKey> {
    size_t operator()(const prism::cache::CacheKey& k) const noexcept {
        return std::hash<std::string>{}(k.getKey());
    }
};
} // namespace std
