#include "core/projection_error.h"

namespace prism {
namespace core {

SyntaxError::SyntaxError(const std::string& input, size_t position, const std::string& reason, int http_status)
    : ProjectionException(
          "Invalid projection syntax at position " + std::to_string(position) + ": " + reason + ". Input: " + input,
          "", CODE, http_status)
    , input_(input)
    , position_(position)
    , reason_(reason)
{}

DepthExceeded::DepthExceeded(const std::string& path, int max_depth, int actual_depth, int http_status)
    : ProjectionException(
          "Projection depth " + std::to_string(actual_depth) + " exceeds maximum allowed depth of "
              + std::to_string(max_depth) + " at path: " + path,
          path, CODE, http_status)
    , max_depth_(max_depth)
    , actual_depth_(actual_depth)
{}

ErrorResponse ErrorResponse::from(const ProjectionException& ex, std::optional<std::string> trace_id) {
    ErrorResponse resp;
    resp.code = ex.code();
    resp.message = ex.what();
    resp.path = ex.path();
    if (auto* syntax = dynamic_cast<const SyntaxError*>(&ex)) {
        resp.position = syntax->position();
    }
    if (trace_id && !trace_id->empty()) {
        resp.trace_id = std::move(trace_id);
    }
    return resp;
}

nlohmann::ordered_json ErrorResponse::toJson() const {
    nlohmann::ordered_json err = {
        {"code", code},
        {"message", message},
        {"path", path}
    };
    if (position) err["position"] = *position;
    if (trace_id) err["traceId"] = *trace_id;
    return {{"error", err}};
}

} // namespace core
} // namespace prism
