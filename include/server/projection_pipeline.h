#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "cache/projection_cache_manager.h"
#include "config/projection_config.h"
#include "projector/response_projector.h"
#include "server/endpoint_options.h"
#include "server/projection_request.h"

namespace prism {
namespace server {

/**
 * @brief Per-user caching was requested but no user could be established
 *
 * Raised instead of falling back to a shared cache entry. Not a client
 * projection error; hosts should answer 401/403.
 */
class UserContextError : public std::runtime_error {
public:
    explicit UserContextError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Request-side projection stage: resolve document -> validate -> project
 *
 * The host calls handle() from its route handler instead of returning the
 * handler's document directly:
 *
 *   EndpointOptions opts;
 *   opts.ttl_seconds = 30;
 *   ProjectableEndpoint users_endpoint(opts);
 *   auto resp = pipeline.handle(req, users_endpoint, [&] { return loadUser(id); });
 *
 * On a cache hit the handler is not called. Non-2xx and non-JSON handler
 * results are returned untouched and never cached. Only GET and HEAD are
 * served from or stored in the cache; other methods always run the handler.
 */
class ProjectionPipeline {
public:
    using Handler = std::function<HandlerResult()>;
    using TimePoint = cache::ProjectionCacheManager::TimePoint;

    ProjectionPipeline(config::ProjectionConfig config,
                       cache::ProjectionCacheManager& cache,
                       std::shared_ptr<const projector::ResponseProjector> projector = nullptr);

    /**
     * @throws UserContextError if the endpoint isolates per user and no
     *         authenticated principal is present, or the identity header
     *         names a different user
     */
    ProjectionResponse handle(const ProjectionRequest& request,
                              const ProjectableEndpoint& endpoint,
                              const Handler& handler) const;

    /**
     * @throws UserContextError as for handle()
     */
    cache::CacheKey buildCacheKey(const ProjectionRequest& request, const EndpointOptions& options) const;

    const config::ProjectionConfig& getConfig() const { return config_; }

    // RFC 1123, e.g. "Sun, 06 Nov 1994 08:49:37 GMT"
    static std::string formatHttpDate(TimePoint ts);
    static std::optional<TimePoint> parseHttpDate(const std::string& value);

private:
    std::optional<std::string> resolveUserContext(const ProjectionRequest& request,
                                                  const EndpointOptions& options) const;

    bool isNotModified(const ProjectionRequest& request, const cache::CachedResponse& entry) const;

    ProjectionResponse projectDocument(const ProjectionRequest& request,
                                       const ProjectableEndpoint& endpoint,
                                       const nlohmann::ordered_json& document,
                                       const std::string& content_type,
                                       const std::optional<std::string>& trace_id) const;

    config::ProjectionConfig config_;
    cache::ProjectionCacheManager& cache_;
    std::shared_ptr<const projector::ResponseProjector> projector_;
};

} // namespace server
} // namespace prism
