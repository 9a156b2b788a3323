#pragma once

#include "projector/response_projector.h"

namespace prism {
namespace projector {

/**
 * @brief Strict whitelist projection over nlohmann::ordered_json documents
 *
 * Objects keep exactly the requested fields in projection order; a requested
 * field that does not exist fails the whole call. Arrays are projected element
 * by element with the same tree; arrays with at least compile_threshold
 * elements walk the tree's precompiled instruction list instead of looking up
 * each field by name. Both paths produce identical output.
 */
class JsonResponseProjector : public ResponseProjector {
public:
    static constexpr size_t DEFAULT_COMPILE_THRESHOLD = 32;

    explicit JsonResponseProjector(size_t compile_threshold = DEFAULT_COMPILE_THRESHOLD)
        : compile_threshold_(compile_threshold) {}

    nlohmann::ordered_json project(const nlohmann::ordered_json& response,
                           const core::ProjectionTree& projection,
                           core::FilterContext& context) const override;

    // "application/json", "application/json; charset=utf-8", "application/problem+json"
    bool supports(const std::string& media_type) const override;

    size_t compileThreshold() const { return compile_threshold_; }

private:
    nlohmann::ordered_json projectNode(const nlohmann::ordered_json& node, const core::ProjectionTree& projection,
                               core::FilterContext& context) const;
    nlohmann::ordered_json projectArray(const nlohmann::ordered_json& array, const core::ProjectionTree& projection,
                                core::FilterContext& context) const;
    nlohmann::ordered_json projectObject(const nlohmann::ordered_json& object, const core::ProjectionTree& projection,
                                 core::FilterContext& context) const;
    nlohmann::ordered_json projectObjectCompiled(const nlohmann::ordered_json& object, const core::ProjectionTree& projection,
                                         core::FilterContext& context) const;
    nlohmann::ordered_json projectField(const std::string& field_name, const nlohmann::ordered_json& value,
                                const core::ProjectionTree& child, core::FilterContext& context) const;

    size_t compile_threshold_;
};

} // namespace projector
} // namespace prism
