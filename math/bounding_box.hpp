#ifndef MAGNETMESH_MATH_BOUNDING_BOX_HPP
#define MAGNETMESH_MATH_BOUNDING_BOX_HPP

#include "vec3.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace magnetmesh {

// Axis-aligned box; an empty box has min > max
struct BoundingBox {
    Vec3 min{std::numeric_limits<double>::max(),
             std::numeric_limits<double>::max(),
             std::numeric_limits<double>::max()};
    Vec3 max{std::numeric_limits<double>::lowest(),
             std::numeric_limits<double>::lowest(),
             std::numeric_limits<double>::lowest()};

    static BoundingBox from_corners(const Vec3& a, const Vec3& b) {
        BoundingBox box;
        box.expand(a);
        box.expand(b);
        return box;
    }

    bool empty() const {
        return min.x > max.x || min.y > max.y || min.z > max.z;
    }

    void expand(const Vec3& p) {
        min = {std::min(min.x, p.x), std::min(min.y, p.y), std::min(min.z, p.z)};
        max = {std::max(max.x, p.x), std::max(max.y, p.y), std::max(max.z, p.z)};
    }

    void merge(const BoundingBox& other) {
        if (other.empty()) return;
        expand(other.min);
        expand(other.max);
    }

    BoundingBox inflated(double eps) const {
        BoundingBox box = *this;
        box.min = box.min - Vec3{eps, eps, eps};
        box.max = box.max + Vec3{eps, eps, eps};
        return box;
    }

    Vec3 center() const {
        return (min + max) * 0.5;
    }

    double diagonal() const {
        return empty() ? 0.0 : (max - min).length();
    }

    bool contains(const Vec3& p) const {
        return p.x >= min.x && p.x <= max.x &&
               p.y >= min.y && p.y <= max.y &&
               p.z >= min.z && p.z <= max.z;
    }

    bool contains(const BoundingBox& other) const {
        return !other.empty() && contains(other.min) && contains(other.max);
    }

    // Largest corner-wise deviation between two boxes
    double distance_to(const BoundingBox& other) const {
        double d = 0.0;
        for (std::size_t i = 0; i < 3; ++i) {
            d = std::max(d, std::abs(min[i] - other.min[i]));
            d = std::max(d, std::abs(max[i] - other.max[i]));
        }
        return d;
    }
};

}  // namespace magnetmesh

#endif // MAGNETMESH_MATH_BOUNDING_BOX_HPP
