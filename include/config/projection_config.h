#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace prism {
namespace config {

using json = nlohmann::ordered_json;

/**
 * @brief Configuration for projection, caching and error reporting
 *
 * YAML layout (all keys optional):
 *
 *   projection:
 *     enabled: true
 *     header_name: X-Response-Fields
 *     max_depth: 5
 *     array_compile_threshold: 32
 *     cycle_detection: { enabled: true }
 *     trace_id: { enabled: true }
 *     cache:
 *       enabled: true
 *       default_ttl_seconds: 60
 *       collection_ttl_seconds: 10
 *       max_entries: 10000
 *       hard_ttl_seconds: 0          # 0 = 2 x default_ttl_seconds
 *       conditional: { enabled: true }
 *       manual_eviction: { enabled: true }
 *       user_context: { header_name: X-User-Id }
 *     error:
 *       syntax_status: 400
 *       missing_field_status: 400
 *       field_not_allowed_status: 400
 *       max_depth_status: 400
 *       cycle_status: 500
 *     logging: { level: info, file: prism.log }
 */
struct ProjectionConfig {
    bool enabled = true;                                // Master switch; disabled = pass-through
    std::string header_name = "X-Response-Fields";      // Request header carrying the directive
    int max_depth = 5;                                  // Maximum nesting during projection
    size_t array_compile_threshold = 32;                // Arrays this large use precompiled instructions

    struct CycleDetectionConfig {
        bool enabled = true;
    } cycle_detection;

    struct TraceIdConfig {
        bool enabled = true;                            // Generate trace ids for error bodies
    } trace_id;

    struct CacheConfig {
        bool enabled = true;
        int default_ttl_seconds = 60;
        int collection_ttl_seconds = 10;
        size_t max_entries = 10000;
        int hard_ttl_seconds = 0;                       // Upper bound for any entry (0 = 2 x default)

        struct ConditionalConfig {
            bool enabled = true;                        // ETag / Last-Modified support
        } conditional;

        struct ManualEvictionConfig {
            bool enabled = true;                        // Pattern-based invalidation
        } manual_eviction;

        struct UserContextConfig {
            std::string header_name = "X-User-Id";
        } user_context;

        int effectiveHardTtlSeconds() const {
            return hard_ttl_seconds > 0 ? hard_ttl_seconds : default_ttl_seconds * 2;
        }
    } cache;

    struct ErrorConfig {
        int syntax_status = 400;
        int missing_field_status = 400;
        int field_not_allowed_status = 400;
        int max_depth_status = 400;
        int cycle_status = 500;
    } error;

    struct LoggingConfig {
        std::string level = "info";
        std::string file = "prism.log";
    } logging;

    /**
     * @brief HTTP status for a projection error code (400 for unknown codes)
     */
    int statusFor(const std::string& error_code) const;

    /**
     * @brief Out-of-range settings, one message each; empty when valid
     */
    std::vector<std::string> validate() const;

    /**
     * @brief Load configuration from YAML file (root key "projection")
     *
     * Falls back to defaults if the file cannot be read or parsed.
     */
    static ProjectionConfig loadFromYaml(const std::string& yaml_path);

    /**
     * @brief Load configuration from JSON (same layout, without the root key)
     */
    static ProjectionConfig fromJson(const json& j);

    json toJson() const;
};

} // namespace config
} // namespace prism
