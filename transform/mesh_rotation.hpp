#ifndef MAGNETMESH_TRANSFORM_MESH_ROTATION_HPP
#define MAGNETMESH_TRANSFORM_MESH_ROTATION_HPP

#include <kernel/mesh.hpp>
#include <math/vec3.hpp>

#include <string>

namespace magnetmesh {

// Angle brought back to [0, 360) degrees
double normalize_angle(double degrees);

// "<base>-rotate-<angle with one decimal>deg"
std::string rotated_mesh_name(const std::string& base, double degrees);

// Copy of the mesh with every node rotated about the axis through the
// origin. Connectivity and physical groups are left untouched.
Mesh rotate_mesh(const Mesh& mesh, double degrees, Axis axis = Axis::X);

}  // namespace magnetmesh

#endif // MAGNETMESH_TRANSFORM_MESH_ROTATION_HPP
