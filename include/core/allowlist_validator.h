#pragma once

#include <memory>
#include <string>
#include <vector>
#include "core/projection_tree.h"

namespace prism {
namespace core {

/**
 * @brief Checks requested projections against an endpoint's permitted fields
 *
 * Built once per endpoint from field specs in directive syntax, e.g.
 * {"id", "name", "profile(avatar,bio)"}. Specs naming the same field are
 * merged (union of nested children). Immutable, so one instance can serve
 * concurrent requests.
 *
 * Leaf policy: requesting a permitted field without nesting returns its whole
 * value, even if the allow-list only permits selected children of it. A field
 * permitted only as a leaf may not be descended into.
 */
class AllowlistValidator {
public:
    explicit AllowlistValidator(ProjectionTree allowed_fields);

    /**
     * @brief Build a validator from field specs
     *
     * @return nullptr when no non-blank spec is given (no restriction)
     * @throws SyntaxError if a spec is malformed
     */
    static std::shared_ptr<const AllowlistValidator> fromFieldSpecs(const std::vector<std::string>& field_specs);

    /**
     * @throws FieldNotAllowed at the first violating path, in request order
     */
    void validate(const ProjectionTree& requested) const;

    const ProjectionTree& getAllowedFields() const { return allowed_fields_; }

private:
    void validateTree(const ProjectionTree& requested, const ProjectionTree& allowed,
                      const std::string& current_path) const;

    ProjectionTree allowed_fields_;
};

} // namespace core
} // namespace prism
