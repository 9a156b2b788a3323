#include "server/endpoint_options.h"

namespace prism {
namespace server {

ProjectableEndpoint::ProjectableEndpoint(EndpointOptions options)
    : options_(std::move(options))
    , validator_(core::AllowlistValidator::fromFieldSpecs(options_.allowed_fields))
{}

} // namespace server
} // namespace prism
