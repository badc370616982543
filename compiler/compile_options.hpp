#ifndef MAGNETMESH_COMPILER_COMPILE_OPTIONS_HPP
#define MAGNETMESH_COMPILER_COMPILE_OPTIONS_HPP

#include <naming/physical_groups.hpp>
#include <transform/transform_spec.hpp>

#include <optional>
#include <string>

namespace magnetmesh {

enum class CompileMode {
    Full3D,           // axisymmetric profile revolved about y
    Axisymmetric2D,   // (r, z) half plane
    Sector2D          // planar plate sector between two tie rods
};

std::string mode_name(CompileMode mode);

// Padding box around the assembly, scaled from its extent
struct AirOptions {
    double r_ratio = 1.5;
    double z_ratio = 1.5;
};

struct CompileOptions {
    CompileMode mode = CompileMode::Axisymmetric2D;
    std::optional<AirOptions> air;
    bool thick_channels = false;     // insert channels as fluid solids
    GroupingOptions grouping;
    TransformSpec transform;         // revolution for Full3D
    double boundary_tolerance = 1e-5;  // relative to the assembly size

    // Throws ValidationError on inconsistent options
    void validate() const;
};

}  // namespace magnetmesh

#endif // MAGNETMESH_COMPILER_COMPILE_OPTIONS_HPP
