#include "server/projection_pipeline.h"
#include "core/filter_context.h"
#include "core/projection_error.h"
#include "core/projection_parser.h"
#include "projector/json_response_projector.h"
#include "utils/logger.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

namespace prism {
namespace server {

using json = nlohmann::ordered_json;

namespace {

std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

bool isCacheableMethod(const std::string& method) {
    std::string m = toUpper(method);
    return m == "GET" || m == "HEAD";
}

ProjectionResponse passThrough(HandlerResult result) {
    ProjectionResponse response;
    response.status = result.status;
    response.body = std::move(result.body);
    response.headers["Content-Type"] = result.content_type;
    return response;
}

void addValidatorHeaders(ProjectionResponse& response, const cache::CachedResponse& entry) {
    if (entry.getEtag()) {
        response.headers["ETag"] = "\"" + *entry.getEtag() + "\"";
    }
    if (entry.getLastModified()) {
        response.headers["Last-Modified"] = ProjectionPipeline::formatHttpDate(*entry.getLastModified());
    }
}

} // namespace

ProjectionPipeline::ProjectionPipeline(config::ProjectionConfig config,
                                       cache::ProjectionCacheManager& cache,
                                       std::shared_ptr<const projector::ResponseProjector> projector)
    : config_(std::move(config))
    , cache_(cache)
    , projector_(std::move(projector)) {
    if (!projector_) {
        projector_ = std::make_shared<projector::JsonResponseProjector>(config_.array_compile_threshold);
    }
}

// ============================================================================
// Request handling
// ============================================================================

ProjectionResponse ProjectionPipeline::handle(const ProjectionRequest& request,
                                              const ProjectableEndpoint& endpoint,
                                              const Handler& handler) const {
    if (!config_.enabled) {
        return passThrough(handler());
    }

    std::optional<std::string> trace_id = request.trace_id;
    if (!trace_id && config_.trace_id.enabled) {
        trace_id = core::FilterContext::generateTraceId();
    }

    const EndpointOptions& options = endpoint.options();
    const bool cacheable = config_.cache.enabled && isCacheableMethod(request.method);

    std::optional<cache::CacheKey> key;
    cache::ProjectionCacheManager::EntryPtr entry;
    bool cache_hit = false;
    json fresh_document;
    std::string content_type = "application/json";

    if (cacheable) {
        key = buildCacheKey(request, options);
        entry = cache_.get(*key);
        cache_hit = entry != nullptr;
        if (entry) {
            content_type = entry->getContentType();
        }
    }

    if (!entry) {
        HandlerResult result = handler();
        if (!result.isSuccess()) {
            PRISM_DEBUG("Handler returned {} for {} {}, passing through", result.status,
                        request.method, request.path);
            return passThrough(std::move(result));
        }
        if (!projector_->supports(result.content_type)) {
            return passThrough(std::move(result));
        }
        content_type = result.content_type;
        if (key) {
            entry = cache_.put(*key, std::move(result.body), options.ttl_seconds, options.collection,
                               result.content_type);
        } else {
            fresh_document = std::move(result.body);
        }
    }

    if (entry && config_.cache.conditional.enabled && isNotModified(request, *entry)) {
        ProjectionResponse not_modified;
        not_modified.status = 304;
        not_modified.cache_hit = cache_hit;
        addValidatorHeaders(not_modified, *entry);
        not_modified.headers["X-Cache"] = cache_hit ? "HIT" : "MISS";
        return not_modified;
    }

    const json& document = entry ? entry->getFullResponse() : fresh_document;
    ProjectionResponse response = projectDocument(request, endpoint, document, content_type, trace_id);
    response.cache_hit = cache_hit;
    if (key) {
        response.headers["X-Cache"] = cache_hit ? "HIT" : "MISS";
    }
    if (entry && response.status >= 200 && response.status < 300) {
        addValidatorHeaders(response, *entry);
    }
    return response;
}

ProjectionResponse ProjectionPipeline::projectDocument(const ProjectionRequest& request,
                                                       const ProjectableEndpoint& endpoint,
                                                       const json& document,
                                                       const std::string& content_type,
                                                       const std::optional<std::string>& trace_id) const {
    ProjectionResponse response;
    response.headers["Content-Type"] = content_type;

    auto directive = request.header(config_.header_name);
    if (!directive || isBlank(*directive)) {
        response.body = document;
        return response;
    }

    try {
        core::ProjectionTree tree = core::ProjectionParser::parse(*directive);
        if (const core::AllowlistValidator* validator = endpoint.validator()) {
            validator->validate(tree);
        }
        core::FilterContext context(config_.max_depth, config_.cycle_detection.enabled, trace_id);
        response.body = projector_->project(document, tree, context);
    } catch (const core::ProjectionException& ex) {
        PRISM_WARN("Projection failed for {} {} [{}]: {} (code={}, path='{}', trace={})",
                   request.method, request.path, *directive, ex.what(), ex.code(), ex.path(),
                   trace_id.value_or("-"));
        response.status = config_.statusFor(ex.code());
        response.body = core::ErrorResponse::from(ex, trace_id).toJson();
        response.headers["Content-Type"] = "application/json";
    }
    return response;
}

// ============================================================================
// Cache key / user context
// ============================================================================

cache::CacheKey ProjectionPipeline::buildCacheKey(const ProjectionRequest& request,
                                                  const EndpointOptions& options) const {
    return cache::CacheKey(request.method, request.path, request.query,
                           resolveUserContext(request, options));
}

std::optional<std::string> ProjectionPipeline::resolveUserContext(const ProjectionRequest& request,
                                                                  const EndpointOptions& options) const {
    if (!options.user_context) {
        return std::nullopt;
    }

    std::optional<std::string> from_header = request.header(config_.cache.user_context.header_name);
    if (from_header && isBlank(*from_header)) {
        from_header.reset();
    }
    std::optional<std::string> principal = request.principal;
    if (principal && isBlank(*principal)) {
        principal.reset();
    }

    // The header is client-controlled; only the authenticated principal partitions the cache
    if (!principal) {
        PRISM_ERROR("User context required for {} {} but no authenticated principal was supplied",
                    request.method, request.path);
        throw UserContextError("Authenticated principal required for per-user cached endpoint");
    }
    if (from_header && *from_header != *principal) {
        PRISM_ERROR("User context mismatch for {} {}: header '{}' does not match principal",
                    request.method, request.path, config_.cache.user_context.header_name);
        throw UserContextError("User identity header does not match the authenticated principal");
    }
    return principal;
}

// ============================================================================
// Conditional requests
// ============================================================================

bool ProjectionPipeline::isNotModified(const ProjectionRequest& request, const cache::CachedResponse& entry) const {
    if (!isCacheableMethod(request.method)) {
        return false;
    }

    // If-None-Match takes precedence; If-Modified-Since is ignored when present
    if (auto if_none_match = request.header("If-None-Match")) {
        return entry.getEtag() && cache::ProjectionCacheManager::matchesEtag(*entry.getEtag(), *if_none_match);
    }

    if (auto if_modified_since = request.header("If-Modified-Since")) {
        auto client_time = parseHttpDate(*if_modified_since);
        if (!client_time || !entry.getLastModified()) {
            return false;
        }
        return *client_time >= *entry.getLastModified();
    }
    return false;
}

std::string ProjectionPipeline::formatHttpDate(TimePoint ts) {
    std::time_t t = cache::CachedResponse::Clock::to_time_t(ts);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::put_time(&tm, "%a, %d %b %Y %H:%M:%S GMT");
    return oss.str();
}

std::optional<ProjectionPipeline::TimePoint> ProjectionPipeline::parseHttpDate(const std::string& value) {
    std::tm tm{};
    std::istringstream iss(value);
    iss.imbue(std::locale::classic());
    iss >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }
    std::string zone;
    iss >> zone;
    if (zone != "GMT" && zone != "UTC") {
        return std::nullopt;
    }
    std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return cache::CachedResponse::Clock::from_time_t(t);
}

} // namespace server
} // namespace prism
