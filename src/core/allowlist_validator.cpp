#include "core/allowlist_validator.h"
#include "core/projection_error.h"
#include "core/projection_parser.h"

namespace prism {
namespace core {

namespace {

// Union of two permission trees. A nested side wins over a bare leaf so that
// {"profile", "profile(avatar)"} still allows descending into avatar.
ProjectionTree mergeTrees(const ProjectionTree& left, const ProjectionTree& right) {
    auto builder = ProjectionTree::builder();
    for (const auto& ins : left.compile()) {
        builder.addChild(ins.field_name, *ins.child);
    }
    for (const auto& ins : right.compile()) {
        const ProjectionTree* existing = builder.getChild(ins.field_name);
        if (existing == nullptr) {
            builder.addChild(ins.field_name, *ins.child);
        } else if (!existing->isEmpty() || !ins.is_leaf) {
            builder.addChild(ins.field_name, mergeTrees(*existing, *ins.child));
        }
    }
    return builder.build();
}

} // namespace

AllowlistValidator::AllowlistValidator(ProjectionTree allowed_fields)
    : allowed_fields_(std::move(allowed_fields)) {}

std::shared_ptr<const AllowlistValidator> AllowlistValidator::fromFieldSpecs(const std::vector<std::string>& field_specs) {
    ProjectionTree merged;
    bool any = false;
    for (const auto& spec : field_specs) {
        ProjectionTree parsed = ProjectionParser::parse(spec);
        if (parsed.isEmpty()) {
            continue;
        }
        merged = mergeTrees(merged, parsed);
        any = true;
    }
    if (!any) {
        return nullptr;
    }
    return std::make_shared<const AllowlistValidator>(std::move(merged));
}

void AllowlistValidator::validate(const ProjectionTree& requested) const {
    validateTree(requested, allowed_fields_, "");
}

void AllowlistValidator::validateTree(const ProjectionTree& requested, const ProjectionTree& allowed,
                                      const std::string& current_path) const {
    for (const auto& ins : requested.compile()) {
        std::string field_path = current_path.empty() ? ins.field_name : current_path + "." + ins.field_name;

        const ProjectionTree* allowed_child = allowed.getChild(ins.field_name);
        if (allowed_child == nullptr) {
            throw FieldNotAllowed(field_path);
        }

        if (!ins.is_leaf) {
            if (allowed_child->isEmpty()) {
                throw FieldNotAllowed(field_path);
            }
            validateTree(*ins.child, *allowed_child, field_path);
        }
    }
}

} // namespace core
} // namespace prism
