#include "cache/cache_key.h"

#include <algorithm>
#include <cctype>
#include <vector>

namespace prism {
namespace cache {

namespace {

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

} // namespace

CacheKey::CacheKey(const std::string& method, const std::string& path, const std::string& query_string,
                   std::optional<std::string> user_context)
    : method_(method)
    , path_(normalizePath(path))
    , query_(normalizeQuery(query_string)) {
    std::transform(method_.begin(), method_.end(), method_.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (user_context && !trim(*user_context).empty()) {
        user_context_ = std::move(user_context);
    }

    key_.reserve(method_.size() + path_.size() + query_.size() + 8);
    key_ += method_;
    key_ += ':';
    key_ += path_;
    if (!query_.empty()) {
        key_ += '?';
        key_ += query_;
    }
    if (user_context_) {
        key_ += '@';
        key_ += *user_context_;
    }
}

std::string CacheKey::normalizePath(const std::string& path) {
    std::string normalized = trim(path);
    if (normalized.empty()) {
        return "/";
    }
    if (normalized.front() != '/') {
        normalized.insert(normalized.begin(), '/');
    }
    if (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    return normalized;
}

std::string CacheKey::normalizeQuery(const std::string& query_string) {
    std::vector<std::string> params;
    size_t start = 0;
    while (start <= query_string.size()) {
        size_t amp = query_string.find('&', start);
        if (amp == std::string::npos) amp = query_string.size();
        std::string token = query_string.substr(start, amp - start);
        if (!trim(token).empty()) {
            params.push_back(std::move(token));
        }
        start = amp + 1;
    }

    std::sort(params.begin(), params.end());

    std::string out;
    for (const auto& p : params) {
        if (!out.empty()) out += '&';
        out += p;
    }
    return out;
}

} // namespace cache
} // namespace prism
