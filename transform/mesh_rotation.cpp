#include "mesh_rotation.hpp"

#include <common/logging.hpp>

#include <spdlog/fmt/fmt.h>

#include <cmath>

namespace magnetmesh {

double normalize_angle(double degrees) {
    double a = std::fmod(degrees, 360.0);
    return a < 0.0 ? a + 360.0 : a;
}

std::string rotated_mesh_name(const std::string& base, double degrees) {
    return fmt::format("{}-rotate-{:.1f}deg", base, degrees);
}

Mesh rotate_mesh(const Mesh& mesh, double degrees, Axis axis) {
    Mesh result = mesh;
    result.name = rotated_mesh_name(mesh.name, degrees);
    const double angle = degrees_to_radians(normalize_angle(degrees));
    const long count = static_cast<long>(result.nodes.size());

#ifdef _OPENMP
    #pragma omp parallel for
#endif
    for (long i = 0; i < count; ++i) {
        auto& node = result.nodes[static_cast<std::size_t>(i)];
        node.position = rotate_about(node.position, axis, angle);
    }

    logging::get_logger()->debug("Rotated {} nodes of '{}' by {} degrees", count, mesh.name,
                                 degrees);
    return result;
}

}  // namespace magnetmesh
