#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/filter_context.h"
#include "core/projection_tree.h"

namespace prism {
namespace projector {

/**
 * @brief Interface for applying a projection tree to a response document
 *
 * Keeps the request pipeline independent of the document format.
 */
class ResponseProjector {
public:
    virtual ~ResponseProjector() = default;

    /**
     * @brief Apply the projection to a full response document
     *
     * @param response Full, unfiltered document
     * @param projection Fields to keep; empty keeps everything
     * @param context Depth/cycle guard for this call
     * @return Filtered document
     * @throws core::ProjectionException on missing fields, depth or cycle violations
     */
    virtual nlohmann::ordered_json project(const nlohmann::ordered_json& response,
                                   const core::ProjectionTree& projection,
                                   core::FilterContext& context) const = 0;

    /**
     * @brief Whether this projector can handle responses of the given media type
     */
    virtual bool supports(const std::string& media_type) const = 0;
};

} // namespace projector
} // namespace prism
