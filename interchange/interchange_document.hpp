#ifndef MAGNETMESH_INTERCHANGE_INTERCHANGE_DOCUMENT_HPP
#define MAGNETMESH_INTERCHANGE_INTERCHANGE_DOCUMENT_HPP

#include <math/bounding_box.hpp>
#include <math/vec3.hpp>

#include <optional>
#include <string>
#include <vector>

namespace magnetmesh {

enum class InterchangeDimension { Solid, Face, Edge };

std::string dimension_name(InterchangeDimension dimension);
InterchangeDimension dimension_from_name(const std::string& name);

// Kernel dimension of a group: in 2D faces are the solids and edges their
// boundaries
int kernel_dimension(InterchangeDimension dimension, bool is2D);

// Where one member of a group sits in the exported model
struct Locator {
    Vec3 centroid;
    std::optional<BoundingBox> bbox;
};

struct InterchangeGroup {
    std::string name;
    InterchangeDimension dimension = InterchangeDimension::Solid;
    std::vector<Locator> locators;
};

// Named groups exported with a CAD model, without kernel tags
struct InterchangeDocument {
    std::string name;
    std::string shape_format = "BREP";
    std::string shape_file;
    std::vector<InterchangeGroup> groups;

    const InterchangeGroup* find(const std::string& group) const;
};

}  // namespace magnetmesh

#endif // MAGNETMESH_INTERCHANGE_INTERCHANGE_DOCUMENT_HPP
