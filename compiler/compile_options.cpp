#include "compile_options.hpp"

#include <common/errors.hpp>

namespace magnetmesh {

std::string mode_name(CompileMode mode) {
    switch (mode) {
        case CompileMode::Full3D: return "3D";
        case CompileMode::Axisymmetric2D: return "Axi";
        case CompileMode::Sector2D: return "2D";
    }
    return "unknown";
}

void CompileOptions::validate() const {
    if (air && (air->r_ratio < 1.0 || air->z_ratio < 1.0)) {
        throw ValidationError("air ratios must be greater than or equal to 1");
    }
    if (!(boundary_tolerance > 0.0)) {
        throw ValidationError("boundary tolerance must be positive");
    }
    if (mode == CompileMode::Full3D) {
        transform.validate();
    }
    if (mode == CompileMode::Sector2D && air) {
        throw ValidationError("the planar sector mode has no air domain");
    }
}

}  // namespace magnetmesh
