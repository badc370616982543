#include "interchange_document.hpp"

#include <common/errors.hpp>

namespace magnetmesh {

std::string dimension_name(InterchangeDimension dimension) {
    switch (dimension) {
        case InterchangeDimension::Solid: return "solid";
        case InterchangeDimension::Face: return "face";
        case InterchangeDimension::Edge: return "edge";
    }
    return "unknown";
}

InterchangeDimension dimension_from_name(const std::string& name) {
    if (name == "solid") return InterchangeDimension::Solid;
    if (name == "face") return InterchangeDimension::Face;
    if (name == "edge") return InterchangeDimension::Edge;
    throw ValidationError("unknown interchange group dimension '" + name + "'");
}

int kernel_dimension(InterchangeDimension dimension, bool is2D) {
    switch (dimension) {
        case InterchangeDimension::Solid:
            if (is2D) {
                throw ValidationError("solid groups cannot appear in a 2D interchange file");
            }
            return 3;
        case InterchangeDimension::Face: return 2;
        case InterchangeDimension::Edge: return 1;
    }
    return 0;
}

const InterchangeGroup* InterchangeDocument::find(const std::string& group) const {
    for (const auto& g : groups) {
        if (g.name == group) return &g;
    }
    return nullptr;
}

}  // namespace magnetmesh
