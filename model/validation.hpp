#ifndef MAGNETMESH_MODEL_VALIDATION_HPP
#define MAGNETMESH_MODEL_VALIDATION_HPP

#include "geometry_model.hpp"

namespace magnetmesh {

// Checks the parameters of a node and its children; throws ValidationError
// on the first malformed parameter
void validate(const GeometryNode& node, const GeometryModel& model);

// Checks the root node of the model plus everything it references
void validate(const GeometryModel& model);

}  // namespace magnetmesh

#endif // MAGNETMESH_MODEL_VALIDATION_HPP
