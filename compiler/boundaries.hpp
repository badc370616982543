#ifndef MAGNETMESH_COMPILER_BOUNDARIES_HPP
#define MAGNETMESH_COMPILER_BOUNDARIES_HPP

#include <kernel/kernel.hpp>
#include <model/geometry_model.hpp>
#include <naming/entity_lineage.hpp>
#include <naming/naming_registry.hpp>

#include <string>
#include <vector>

namespace magnetmesh {

// Straight segment of the (r, z) profile
struct ProfileSegment {
    double r0 = 0.0;
    double z0 = 0.0;
    double r1 = 0.0;
    double z1 = 0.0;
};

// Named boundary made of one or more profile segments, resolved by
// geometric queries once the geometry is final
struct BoundarySpec {
    std::vector<std::string> path;
    Category category = Category::Boundary;
    std::vector<ProfileSegment> segments;
    bool indexed = false;
};

// Registered boundary name and the segments that locate it
struct BoundaryQuery {
    NameId name = 0;
    std::vector<ProfileSegment> segments;
};

// Whether the profile has been revolved, and by how much
struct RevolutionFrame {
    bool revolved = false;
    double angle = 360.0;
};

// Box covering the segment, or the surface it sweeps once revolved
BoundingBox sweep_box(const ProfileSegment& segment, const RevolutionFrame& frame);

// Entities of dimension (profile dim - 1) lying on the segment: curves in
// the profile plane, surfaces of revolution in 3D
DimTags find_boundary(const Kernel& kernel, const ProfileSegment& segment,
                      const RevolutionFrame& frame, double eps);

// Planar faces bounding a revolved sector at the given angle (multiples of
// 90 degrees)
DimTags find_symmetry_plane(const Kernel& kernel, double angle, double r_max,
                            double y_min, double y_max, double eps);

// Radius reached by a box around the y axis
double radial_reach(const BoundingBox& box);

// Union of find_boundary over several segments, sorted
DimTags find_boundaries(const Kernel& kernel, const std::vector<ProfileSegment>& segments,
                        const RevolutionFrame& frame, double eps);

// Rebinds every queried name to what its segments find now; names that find
// nothing are reported in warnings
void refresh_boundaries(const Kernel& kernel, const NamingRegistry& registry,
                        EntityLineage& lineage, const std::vector<BoundaryQuery>& queries,
                        const RevolutionFrame& frame, double eps,
                        std::vector<std::string>& warnings);

// Registers Sym0 and Sym1 on the planar faces at 0 and angle degrees
void bind_symmetry_planes(const Kernel& kernel, NamingRegistry& registry, EntityLineage& lineage,
                          double angle, const AxiExtent& domain, double eps,
                          std::vector<std::string>& warnings);

}  // namespace magnetmesh

#endif // MAGNETMESH_COMPILER_BOUNDARIES_HPP
