#include "config/projection_config.h"
#include "core/projection_error.h"
#include "utils/logger.h"

#include <yaml-cpp/yaml.h>

namespace prism {
namespace config {

int ProjectionConfig::statusFor(const std::string& error_code) const {
    if (error_code == core::SyntaxError::CODE) return error.syntax_status;
    if (error_code == core::MissingField::CODE) return error.missing_field_status;
    if (error_code == core::FieldNotAllowed::CODE) return error.field_not_allowed_status;
    if (error_code == core::DepthExceeded::CODE) return error.max_depth_status;
    if (error_code == core::CycleDetected::CODE) return error.cycle_status;
    return 400;
}

std::vector<std::string> ProjectionConfig::validate() const {
    std::vector<std::string> problems;
    if (header_name.empty()) problems.push_back("header_name must not be empty");
    if (max_depth <= 0) problems.push_back("max_depth must be positive");
    if (cache.default_ttl_seconds <= 0) problems.push_back("cache.default_ttl_seconds must be positive");
    if (cache.collection_ttl_seconds <= 0) problems.push_back("cache.collection_ttl_seconds must be positive");
    if (cache.hard_ttl_seconds < 0) problems.push_back("cache.hard_ttl_seconds must not be negative");
    if (cache.max_entries == 0) problems.push_back("cache.max_entries must be positive");

    auto check_status = [&](int status, const char* name) {
        if (status < 400 || status > 599) {
            problems.push_back(std::string("error.") + name + " must be a 4xx or 5xx status");
        }
    };
    check_status(error.syntax_status, "syntax_status");
    check_status(error.missing_field_status, "missing_field_status");
    check_status(error.field_not_allowed_status, "field_not_allowed_status");
    check_status(error.max_depth_status, "max_depth_status");
    check_status(error.cycle_status, "cycle_status");
    return problems;
}

ProjectionConfig ProjectionConfig::loadFromYaml(const std::string& yaml_path) {
    try {
        YAML::Node root = YAML::LoadFile(yaml_path);
        ProjectionConfig result;

        YAML::Node p = root["projection"];
        if (!p) {
            PRISM_WARN("No 'projection' section in {}, using defaults", yaml_path);
            return result;
        }

        result.enabled = p["enabled"].as<bool>(true);
        result.header_name = p["header_name"].as<std::string>("X-Response-Fields");
        result.max_depth = p["max_depth"].as<int>(5);
        result.array_compile_threshold = p["array_compile_threshold"].as<size_t>(32);

        if (p["cycle_detection"]) {
            result.cycle_detection.enabled = p["cycle_detection"]["enabled"].as<bool>(true);
        }
        if (p["trace_id"]) {
            result.trace_id.enabled = p["trace_id"]["enabled"].as<bool>(true);
        }

        if (p["cache"]) {
            auto cache = p["cache"];
            result.cache.enabled = cache["enabled"].as<bool>(true);
            result.cache.default_ttl_seconds = cache["default_ttl_seconds"].as<int>(60);
            result.cache.collection_ttl_seconds = cache["collection_ttl_seconds"].as<int>(10);
            result.cache.max_entries = cache["max_entries"].as<size_t>(10000);
            result.cache.hard_ttl_seconds = cache["hard_ttl_seconds"].as<int>(0);

            if (cache["conditional"]) {
                result.cache.conditional.enabled = cache["conditional"]["enabled"].as<bool>(true);
            }
            if (cache["manual_eviction"]) {
                result.cache.manual_eviction.enabled = cache["manual_eviction"]["enabled"].as<bool>(true);
            }
            if (cache["user_context"]) {
                result.cache.user_context.header_name =
                    cache["user_context"]["header_name"].as<std::string>("X-User-Id");
            }
        }

        if (p["error"]) {
            auto err = p["error"];
            result.error.syntax_status = err["syntax_status"].as<int>(400);
            result.error.missing_field_status = err["missing_field_status"].as<int>(400);
            result.error.field_not_allowed_status = err["field_not_allowed_status"].as<int>(400);
            result.error.max_depth_status = err["max_depth_status"].as<int>(400);
            result.error.cycle_status = err["cycle_status"].as<int>(500);
        }

        if (p["logging"]) {
            result.logging.level = p["logging"]["level"].as<std::string>("info");
            result.logging.file = p["logging"]["file"].as<std::string>("prism.log");
        }

        for (const auto& problem : result.validate()) {
            PRISM_WARN("Projection config {}: {}", yaml_path, problem);
        }

        PRISM_INFO("Loaded projection configuration from {}", yaml_path);
        return result;
    } catch (const std::exception& e) {
        PRISM_ERROR("Failed to load projection configuration from {}: {}", yaml_path, e.what());
        return ProjectionConfig();  // Return default config
    }
}

ProjectionConfig ProjectionConfig::fromJson(const json& j) {
    ProjectionConfig result;

    try {
        result.enabled = j.value("enabled", true);
        result.header_name = j.value("header_name", std::string("X-Response-Fields"));
        result.max_depth = j.value("max_depth", 5);
        result.array_compile_threshold = j.value("array_compile_threshold", static_cast<size_t>(32));

        if (j.contains("cycle_detection")) {
            result.cycle_detection.enabled = j["cycle_detection"].value("enabled", true);
        }
        if (j.contains("trace_id")) {
            result.trace_id.enabled = j["trace_id"].value("enabled", true);
        }

        if (j.contains("cache")) {
            const auto& cache = j["cache"];
            result.cache.enabled = cache.value("enabled", true);
            result.cache.default_ttl_seconds = cache.value("default_ttl_seconds", 60);
            result.cache.collection_ttl_seconds = cache.value("collection_ttl_seconds", 10);
            result.cache.max_entries = cache.value("max_entries", static_cast<size_t>(10000));
            result.cache.hard_ttl_seconds = cache.value("hard_ttl_seconds", 0);
            if (cache.contains("conditional")) {
                result.cache.conditional.enabled = cache["conditional"].value("enabled", true);
            }
            if (cache.contains("manual_eviction")) {
                result.cache.manual_eviction.enabled = cache["manual_eviction"].value("enabled", true);
            }
            if (cache.contains("user_context")) {
                result.cache.user_context.header_name =
                    cache["user_context"].value("header_name", std::string("X-User-Id"));
            }
        }

        if (j.contains("error")) {
            const auto& err = j["error"];
            result.error.syntax_status = err.value("syntax_status", 400);
            result.error.missing_field_status = err.value("missing_field_status", 400);
            result.error.field_not_allowed_status = err.value("field_not_allowed_status", 400);
            result.error.max_depth_status = err.value("max_depth_status", 400);
            result.error.cycle_status = err.value("cycle_status", 500);
        }

        if (j.contains("logging")) {
            result.logging.level = j["logging"].value("level", std::string("info"));
            result.logging.file = j["logging"].value("file", std::string("prism.log"));
        }
    } catch (const json::exception& e) {
        PRISM_ERROR("Invalid projection configuration JSON: {}", e.what());
        return ProjectionConfig();
    }

    return result;
}

json ProjectionConfig::toJson() const {
    return {
        {"enabled", enabled},
        {"header_name", header_name},
        {"max_depth", max_depth},
        {"array_compile_threshold", array_compile_threshold},
        {"cycle_detection", {{"enabled", cycle_detection.enabled}}},
        {"trace_id", {{"enabled", trace_id.enabled}}},
        {"cache", {
            {"enabled", cache.enabled},
            {"default_ttl_seconds", cache.default_ttl_seconds},
            {"collection_ttl_seconds", cache.collection_ttl_seconds},
            {"max_entries", cache.max_entries},
            {"hard_ttl_seconds", cache.hard_ttl_seconds},
            {"conditional", {{"enabled", cache.conditional.enabled}}},
            {"manual_eviction", {{"enabled", cache.manual_eviction.enabled}}},
            {"user_context", {{"header_name", cache.user_context.header_name}}}
        }},
        {"error", {
            {"syntax_status", error.syntax_status},
            {"missing_field_status", error.missing_field_status},
            {"field_not_allowed_status", error.field_not_allowed_status},
            {"max_depth_status", error.max_depth_status},
            {"cycle_status", error.cycle_status}
        }},
        {"logging", {{"level", logging.level}, {"file", logging.file}}}
    };
}

} // namespace config
} // namespace prism
