#include "server/cache_invalidator.h"
#include "utils/logger.h"

namespace prism {
namespace server {

size_t CacheInvalidator::invalidate(const std::vector<std::string>& path_templates,
                                    const PathVariables& path_variables) const {
    if (!cache_.getConfig().enabled || !cache_.getConfig().manual_eviction.enabled) {
        PRISM_DEBUG("Manual cache eviction disabled, skipping {} template(s)", path_templates.size());
        return 0;
    }

    size_t removed = 0;
    for (const auto& path_template : path_templates) {
        if (path_template.empty()) {
            continue;
        }
        std::string resolved = resolvePathVariables(path_template, path_variables);
        // evictByPathPattern evicts exact GET/HEAD keys when nothing is left to match
        size_t n = cache_.evictByPathPattern(resolved);
        PRISM_DEBUG("Invalidated {} entr{} for '{}'", n, n == 1 ? "y" : "ies", resolved);
        removed += n;
    }
    return removed;
}

HandlerResult CacheInvalidator::invalidateAfter(const WriteHandler& write_handler,
                                                const std::vector<std::string>& path_templates,
                                                const PathVariables& path_variables) const {
    HandlerResult result = write_handler();
    if (result.isSuccess()) {
        size_t removed = invalidate(path_templates, path_variables);
        PRISM_DEBUG("Write succeeded ({}), evicted {} cache entries", result.status, removed);
    }
    return result;
}

std::string CacheInvalidator::resolvePathVariables(const std::string& path_template,
                                                   const PathVariables& path_variables) {
    std::string resolved;
    resolved.reserve(path_template.size());

    size_t pos = 0;
    while (pos < path_template.size()) {
        size_t open = path_template.find('{', pos);
        if (open == std::string::npos) {
            break;
        }
        size_t close = path_template.find('}', open + 1);
        if (close == std::string::npos) {
            break;
        }
        resolved.append(path_template, pos, open - pos);

        auto it = path_variables.find(path_template.substr(open + 1, close - open - 1));
        if (it != path_variables.end()) {
            resolved += it->second;
        } else {
            resolved.append(path_template, open, close - open + 1);
        }
        pos = close + 1;
    }
    if (pos < path_template.size()) {
        resolved.append(path_template, pos, std::string::npos);
    }
    return resolved;
}

} // namespace server
} // namespace prism
