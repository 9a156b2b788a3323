#pragma once

#include <memory>
#include <string>
#include <vector>
#include "core/allowlist_validator.h"

namespace prism {
namespace server {

/**
 * @brief Per-route projection settings, supplied at route registration
 */
struct EndpointOptions {
    int ttl_seconds = -1;                       // <= 0: use configured default
    bool collection = false;                    // Use collection TTL
    bool user_context = false;                  // Isolate cache entries per user
    std::vector<std::string> allowed_fields;    // Directive-syntax specs; empty = unrestricted
};

/**
 * @brief A registered route's options plus its prebuilt allow-list
 *
 * The allow-list is parsed once here and shared read-only by every request.
 */
class ProjectableEndpoint {
public:
    /**
     * @throws core::SyntaxError if an allowed_fields spec is malformed
     */
    explicit ProjectableEndpoint(EndpointOptions options);

    const EndpointOptions& options() const { return options_; }
    // nullptr when the endpoint has no allow-list
    const core::AllowlistValidator* validator() const { return validator_.get(); }

private:
    EndpointOptions options_;
    std::shared_ptr<const core::AllowlistValidator> validator_;
};

} // namespace server
} // namespace prism
