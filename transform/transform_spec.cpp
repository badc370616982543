#include "transform_spec.hpp"

#include <common/errors.hpp>

#include <cmath>
#include <string>

namespace magnetmesh {

namespace {

constexpr double ANGLE_TOLERANCE = 1e-9;

}  // namespace

double TransformSpec::sector_angle() const {
    return sector_count > 1 ? 360.0 / sector_count : revolution_angle;
}

void TransformSpec::validate() const {
    if (sector_count != 1 && sector_count != 2 && sector_count != 4) {
        throw ValidationError("sector count must be 1, 2 or 4, got " + std::to_string(sector_count));
    }
    if (!(revolution_angle > 0.0) || revolution_angle > 360.0) {
        throw ValidationError("revolution angle must be within (0, 360] degrees");
    }
    if (sector_count > 1 && revolution_angle != 360.0 &&
        std::abs(revolution_angle - 360.0 / sector_count) > ANGLE_TOLERANCE) {
        throw ValidationError("revolution angle disagrees with the sector count");
    }
    double angle = sector_angle();
    double pieces = 360.0 / angle;
    if (std::abs(pieces - std::round(pieces)) > ANGLE_TOLERANCE * pieces) {
        throw ValidationError("sector angle " + std::to_string(angle) +
                              " does not evenly divide 360 degrees");
    }
}

}  // namespace magnetmesh
