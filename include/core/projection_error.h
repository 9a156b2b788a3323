#pragma once

#include <stdexcept>
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace prism {
namespace core {

/**
 * @brief Base class for all client-facing projection failures
 *
 * Every subclass carries a stable error code, the dotted field path where the
 * failure happened (empty for syntax errors) and the HTTP status the request
 * pipeline should answer with.
 */
class ProjectionException : public std::runtime_error {
public:
    ProjectionException(const std::string& message, std::string path, std::string code, int http_status)
        : std::runtime_error(message)
        , path_(std::move(path))
        , code_(std::move(code))
        , http_status_(http_status)
    {}

    const std::string& path() const { return path_; }
    const std::string& code() const { return code_; }
    int httpStatus() const { return http_status_; }

private:
    std::string path_;
    std::string code_;
    int http_status_;
};

/**
 * @brief Malformed directive; carries the 0-based offset into the raw input
 */
class SyntaxError : public ProjectionException {
public:
    static constexpr const char* CODE = "INVALID_PROJECTION_SYNTAX";

    SyntaxError(const std::string& input, size_t position, const std::string& reason, int http_status = 400);

    size_t position() const { return position_; }
    const std::string& input() const { return input_; }
    const std::string& reason() const { return reason_; }

private:
    std::string input_;
    size_t position_;
    std::string reason_;
};

class MissingField : public ProjectionException {
public:
    static constexpr const char* CODE = "MISSING_FIELD";

    explicit MissingField(const std::string& path, int http_status = 400)
        : ProjectionException("Requested field does not exist in response: " + path, path, CODE, http_status)
    {}
};

class FieldNotAllowed : public ProjectionException {
public:
    static constexpr const char* CODE = "FIELD_NOT_ALLOWED";

    explicit FieldNotAllowed(const std::string& path, int http_status = 400)
        : ProjectionException("Field is not allowed for projection: " + path, path, CODE, http_status)
    {}
};

class DepthExceeded : public ProjectionException {
public:
    static constexpr const char* CODE = "MAX_DEPTH_EXCEEDED";

    DepthExceeded(const std::string& path, int max_depth, int actual_depth, int http_status = 400);

    int maxDepth() const { return max_depth_; }
    int actualDepth() const { return actual_depth_; }

private:
    int max_depth_;
    int actual_depth_;
};

class CycleDetected : public ProjectionException {
public:
    static constexpr const char* CODE = "CYCLE_DETECTED";

    explicit CycleDetected(const std::string& path, int http_status = 500)
        : ProjectionException("Cycle detected during projection at path: " + path, path, CODE, http_status)
    {}
};

/**
 * @brief Error body handed to the transport layer for serialization
 *
 * Shape: {"error": {"code", "message", "path", "position"?, "traceId"?}}
 */
struct ErrorResponse {
    std::string code;
    std::string message;
    std::string path;
    std::optional<size_t> position;   // syntax errors only
    std::optional<std::string> trace_id;

    static ErrorResponse from(const ProjectionException& ex, std::optional<std::string> trace_id = std::nullopt);

    nlohmann::ordered_json toJson() const;
};

} // namespace core
} // namespace prism
