#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "cache/projection_cache_manager.h"
#include "server/projection_request.h"

namespace prism {
namespace server {

/**
 * @brief Write-path cache eviction
 *
 * Called explicitly by write handlers once their own work has succeeded:
 *
 *   invalidator.invalidateAfter([&] { return updateUser(id, body); },
 *                               {"/users/{id}", "/users"}, {{"id", id}});
 *
 * Known {name} variables are substituted first. A template that still has
 * placeholders evicts every matching path; a fully resolved path evicts its
 * GET and HEAD entries.
 */
class CacheInvalidator {
public:
    using PathVariables = std::map<std::string, std::string>;
    using WriteHandler = std::function<HandlerResult()>;

    explicit CacheInvalidator(cache::ProjectionCacheManager& cache) : cache_(cache) {}

    /**
     * @return Number of entries removed (0 when manual eviction is disabled)
     * @throws std::invalid_argument if a template cannot be compiled
     */
    size_t invalidate(const std::vector<std::string>& path_templates,
                      const PathVariables& path_variables = {}) const;

    /**
     * @brief Run the write handler and evict only if it returned 2xx
     *
     * Exceptions from the handler propagate and nothing is evicted.
     */
    HandlerResult invalidateAfter(const WriteHandler& write_handler,
                                  const std::vector<std::string>& path_templates,
                                  const PathVariables& path_variables = {}) const;

    // Replace {name} with its value for every known name; unknown placeholders stay
    static std::string resolvePathVariables(const std::string& path_template,
                                            const PathVariables& path_variables);

private:
    cache::ProjectionCacheManager& cache_;
};

} // namespace server
} // namespace prism
