#pragma once

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace prism {
namespace core {

/**
 * @brief Per-request traversal guard for projection
 *
 * Tracks the descent path, enforces the depth limit and (optionally) rejects
 * revisiting a path that is still on the stack. The dotted path string is only
 * built when someone asks for it, so successful traversals never concatenate.
 *
 * Not thread-safe; create one per top-level projection call.
 */
class FilterContext {
public:
    static constexpr int DEFAULT_MAX_DEPTH = 5;

    explicit FilterContext(int max_depth = DEFAULT_MAX_DEPTH,
                           bool cycle_detection = true,
                           std::optional<std::string> trace_id = std::nullopt);

    /**
     * @brief Push a field onto the path
     *
     * Depth and cycle checks run before any state changes, so a failed descend
     * leaves the context exactly as it was.
     *
     * @throws std::invalid_argument if field_name is blank
     * @throws DepthExceeded if the new depth would exceed the limit
     * @throws CycleDetected if the prospective path is already being visited
     */
    void descend(const std::string& field_name);

    /**
     * @brief Pop the innermost field
     *
     * Unbalanced calls on an empty stack are ignored (and logged).
     */
    void ascend();

    /**
     * @brief Path the context would have after descending into field_name
     *
     * @throws std::invalid_argument if field_name is blank
     */
    std::string buildPath(const std::string& field_name) const;

    std::string getCurrentPath() const { return materializePath(); }
    int getCurrentDepth() const { return static_cast<int>(path_stack_.size()); }
    int getMaxDepth() const { return max_depth_; }
    bool isCycleDetectionEnabled() const { return cycle_detection_; }
    const std::optional<std::string>& getTraceId() const { return trace_id_; }

    /**
     * @brief Short random identifier for correlating log lines with error bodies
     */
    static std::string generateTraceId();

private:
    std::string materializePath() const;

    int max_depth_;
    bool cycle_detection_;
    std::optional<std::string> trace_id_;

    std::vector<std::string> path_stack_;
    std::unordered_set<std::string> visited_paths_;
};

/**
 * @brief RAII pairing of descend/ascend
 *
 * Ascends on every exit path, including exceptions thrown by the nested
 * projection, so the stack stays consistent for error handlers.
 */
class ScopedDescent {
public:
    ScopedDescent(FilterContext& ctx, const std::string& field_name)
        : ctx_(ctx) {
        ctx_.descend(field_name);
    }
    ~ScopedDescent() { ctx_.ascend(); }

    ScopedDescent(const ScopedDescent&) = delete;
    ScopedDescent& operator=(const ScopedDescent&) = delete;

private:
    FilterContext& ctx_;
};

} // namespace core
} // namespace prism
