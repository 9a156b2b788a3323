#include "projector/json_response_projector.h"
#include "core/projection_error.h"

#include <algorithm>
#include <cctype>

namespace prism {
namespace projector {

using json = nlohmann::ordered_json;
using core::FilterContext;
using core::ProjectionTree;

json JsonResponseProjector::project(const json& response, const ProjectionTree& projection,
                                    FilterContext& context) const {
    if (response.is_null() || projection.isEmpty()) {
        return response;
    }
    return projectNode(response, projection, context);
}

bool JsonResponseProjector::supports(const std::string& media_type) const {
    if (media_type.empty()) {
        return false;
    }
    std::string lower = media_type;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // Strip parameters such as "; charset=utf-8"
    auto semi = lower.find(';');
    std::string essence = lower.substr(0, semi);
    while (!essence.empty() && std::isspace(static_cast<unsigned char>(essence.back()))) {
        essence.pop_back();
    }

    if (essence.find("application/json") != std::string::npos) {
        return true;
    }
    const std::string suffix = "+json";
    return essence.size() > suffix.size()
        && essence.compare(essence.size() - suffix.size(), suffix.size(), suffix) == 0;
}

json JsonResponseProjector::projectNode(const json& node, const ProjectionTree& projection,
                                        FilterContext& context) const {
    if (node.is_array()) {
        return projectArray(node, projection, context);
    }
    if (node.is_object()) {
        return projectObject(node, projection, context);
    }
    return node;
}

json JsonResponseProjector::projectArray(const json& array, const ProjectionTree& projection,
                                         FilterContext& context) const {
    json result = json::array();
    const bool compiled = array.size() >= compile_threshold_;

    for (const auto& element : array) {
        if (compiled && element.is_object()) {
            result.push_back(projectObjectCompiled(element, projection, context));
        } else {
            result.push_back(projectNode(element, projection, context));
        }
    }
    return result;
}

json JsonResponseProjector::projectObject(const json& object, const ProjectionTree& projection,
                                          FilterContext& context) const {
    json result = json::object();

    for (const auto& requested : projection.getChildNames()) {
        auto it = object.find(requested);
        if (it == object.end()) {
            throw core::MissingField(context.buildPath(requested));
        }
        const ProjectionTree* child = projection.getChild(requested);
        result[requested] = projectField(requested, *it, *child, context);
    }
    return result;
}

json JsonResponseProjector::projectObjectCompiled(const json& object, const ProjectionTree& projection,
                                                  FilterContext& context) const {
    json result = json::object();

    for (const auto& ins : projection.compile()) {
        auto it = object.find(ins.field_name);
        if (it == object.end()) {
            throw core::MissingField(context.buildPath(ins.field_name));
        }
        if (ins.is_leaf) {
            result[ins.field_name] = *it;
        } else {
            result[ins.field_name] = projectField(ins.field_name, *it, *ins.child, context);
        }
    }
    return result;
}

json JsonResponseProjector::projectField(const std::string& field_name, const json& value,
                                         const ProjectionTree& child, FilterContext& context) const {
    if (child.isEmpty()) {
        // Leaf: copy verbatim, including null, {} and []
        return value;
    }
    core::ScopedDescent descent(context, field_name);
    return projectNode(value, child, context);
}

} // namespace projector
} // namespace prism
