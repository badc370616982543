#include "boundaries.hpp"

#include <common/logging.hpp>

#include <algorithm>
#include <cmath>
#include <set>

namespace magnetmesh {

namespace {

bool is_right_angle_multiple(double angle) {
    double q = angle / 90.0;
    return std::abs(q - std::round(q)) < 1e-9;
}

}  // namespace

double radial_reach(const BoundingBox& box) {
    return std::max({std::abs(box.min.x), std::abs(box.max.x),
                     std::abs(box.min.z), std::abs(box.max.z)});
}

BoundingBox sweep_box(const ProfileSegment& segment, const RevolutionFrame& frame) {
    if (!frame.revolved) {
        return BoundingBox::from_corners({segment.r0, segment.z0, 0.0},
                                         {segment.r1, segment.z1, 0.0});
    }
    std::vector<double> angles{0.0, frame.angle};
    for (double a = 90.0; a < frame.angle; a += 90.0) {
        angles.push_back(a);
    }
    BoundingBox box;
    for (double a : angles) {
        double t = degrees_to_radians(a);
        for (double r : {segment.r0, segment.r1}) {
            for (double z : {segment.z0, segment.z1}) {
                box.expand(rotate_about({r, z, 0.0}, Axis::Y, t));
            }
        }
    }
    return box;
}

DimTags find_boundary(const Kernel& kernel, const ProfileSegment& segment,
                      const RevolutionFrame& frame, double eps) {
    const int dim = frame.revolved ? 2 : 1;
    DimTags candidates = kernel.entities_in_box(sweep_box(segment, frame).inflated(eps), dim);
    if (!frame.revolved) {
        return candidates;
    }

    // Surfaces of revolution: keep those swept by a segment of the same orientation
    const bool vertical = std::abs(segment.r1 - segment.r0) <= eps;
    const bool horizontal = std::abs(segment.z1 - segment.z0) <= eps;
    DimTags result;
    for (const auto& c : candidates) {
        BoundingBox cb = kernel.bounding_box(c);
        double height = cb.max.y - cb.min.y;
        // Planar cuts at multiples of 90 degrees are flat in x or z
        bool flat = cb.max.x - cb.min.x <= eps || cb.max.z - cb.min.z <= eps;
        if (vertical && (height <= eps || flat ||
                         std::abs(radial_reach(cb) - segment.r0) > eps)) {
            continue;
        }
        if (horizontal && height > eps) {
            continue;
        }
        result.push_back(c);
    }
    return result;
}

DimTags find_symmetry_plane(const Kernel& kernel, double angle, double r_max,
                            double y_min, double y_max, double eps) {
    if (!is_right_angle_multiple(angle)) {
        logging::get_logger()->warn("No symmetry plane query for a {} degree cut", angle);
        return {};
    }
    Vec3 direction = rotate_about({1.0, 0.0, 0.0}, Axis::Y, degrees_to_radians(angle));
    BoundingBox box = BoundingBox::from_corners(
        {0.0, y_min, 0.0}, {r_max * direction.x, y_max, r_max * direction.z});
    const bool along_x = std::abs(direction.x) > 0.5;

    DimTags result;
    for (const auto& c : kernel.entities_in_box(box.inflated(eps), 2)) {
        BoundingBox cb = kernel.bounding_box(c);
        double thickness = along_x ? cb.max.z - cb.min.z : cb.max.x - cb.min.x;
        if (thickness <= eps) {
            result.push_back(c);
        }
    }
    return result;
}

DimTags find_boundaries(const Kernel& kernel, const std::vector<ProfileSegment>& segments,
                        const RevolutionFrame& frame, double eps) {
    std::set<DimTag> tags;
    for (const auto& segment : segments) {
        for (const auto& t : find_boundary(kernel, segment, frame, eps)) {
            tags.insert(t);
        }
    }
    return DimTags(tags.begin(), tags.end());
}

void refresh_boundaries(const Kernel& kernel, const NamingRegistry& registry,
                        EntityLineage& lineage, const std::vector<BoundaryQuery>& queries,
                        const RevolutionFrame& frame, double eps,
                        std::vector<std::string>& warnings) {
    auto log = logging::get_logger();
    for (const auto& query : queries) {
        const SemanticName& name = registry.get(query.name);
        DimTags tags = find_boundaries(kernel, query.segments, frame, eps);
        if (tags.empty()) {
            log->warn("No entity left on '{}'", name.path);
            warnings.push_back("'" + name.path + "' matches no entity");
        }
        lineage.replace(name, tags);
    }
}

void bind_symmetry_planes(const Kernel& kernel, NamingRegistry& registry, EntityLineage& lineage,
                          double angle, const AxiExtent& domain, double eps,
                          std::vector<std::string>& warnings) {
    const char* planes[] = {"Sym0", "Sym1"};
    const double angles[] = {0.0, angle};
    for (int i = 0; i < 2; ++i) {
        DimTags faces = find_symmetry_plane(kernel, angles[i], domain.r_max, domain.z_min,
                                            domain.z_max, eps);
        if (faces.empty()) {
            warnings.push_back(std::string("symmetry plane '") + planes[i] + "' matches no face");
            continue;
        }
        const auto& name = registry.register_name({planes[i]}, Category::Boundary, 2);
        lineage.bind(name, faces);
    }
}

}  // namespace magnetmesh
