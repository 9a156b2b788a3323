#pragma once

#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace prism {
namespace server {

/**
 * @brief Case-insensitive ordering for HTTP header names
 */
struct HeaderNameLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
            [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
    }
};

using HeaderMap = std::map<std::string, std::string, HeaderNameLess>;

/**
 * @brief Transport-independent view of an incoming request
 *
 * Filled in by whatever HTTP server hosts the pipeline.
 */
struct ProjectionRequest {
    std::string method = "GET";
    std::string path = "/";
    std::string query;                          // Raw query string without '?'
    HeaderMap headers;
    std::optional<std::string> principal;       // Authenticated user, if any
    std::optional<std::string> trace_id;        // Caller-supplied correlation id

    std::optional<std::string> header(const std::string& name) const {
        auto it = headers.find(name);
        if (it == headers.end()) return std::nullopt;
        return it->second;
    }
};

/**
 * @brief What an endpoint handler produced (before projection)
 */
struct HandlerResult {
    int status = 200;
    nlohmann::ordered_json body;
    std::string content_type = "application/json";

    bool isSuccess() const { return status >= 200 && status < 300; }
};

/**
 * @brief What the transport should send back
 */
struct ProjectionResponse {
    int status = 200;
    nlohmann::ordered_json body;
    HeaderMap headers;
    bool cache_hit = false;
};

} // namespace server
} // namespace prism
