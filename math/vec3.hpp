#ifndef MAGNETMESH_MATH_VEC3_HPP
#define MAGNETMESH_MATH_VEC3_HPP

#include <cmath>
#include <cstddef>
#include <numbers>

namespace magnetmesh {

struct Vec3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    constexpr Vec3() = default;
    constexpr Vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    constexpr Vec3 operator+(const Vec3& other) const {
        return {x + other.x, y + other.y, z + other.z};
    }

    constexpr Vec3 operator-(const Vec3& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }

    constexpr Vec3 operator*(double scalar) const {
        return {x * scalar, y * scalar, z * scalar};
    }

    constexpr Vec3 operator/(double scalar) const {
        return {x / scalar, y / scalar, z / scalar};
    }

    constexpr Vec3& operator+=(const Vec3& other) {
        x += other.x; y += other.y; z += other.z;
        return *this;
    }

    constexpr double dot(const Vec3& other) const {
        return x * other.x + y * other.y + z * other.z;
    }

    constexpr double length_squared() const {
        return x * x + y * y + z * z;
    }

    double length() const {
        return std::sqrt(length_squared());
    }

    double distance_to(const Vec3& other) const {
        return (*this - other).length();
    }

    constexpr bool operator==(const Vec3& other) const {
        return x == other.x && y == other.y && z == other.z;
    }

    constexpr double operator[](std::size_t i) const {
        if (i == 0) return x;
        if (i == 1) return y;
        return z;
    }

    constexpr double& operator[](std::size_t i) {
        if (i == 0) return x;
        if (i == 1) return y;
        return z;
    }
};

constexpr Vec3 operator*(double scalar, const Vec3& v) {
    return v * scalar;
}

// Coordinate axes used by revolutions and rigid rotations
enum class Axis { X, Y, Z };

inline Vec3 axis_direction(Axis axis) {
    switch (axis) {
        case Axis::X: return {1.0, 0.0, 0.0};
        case Axis::Y: return {0.0, 1.0, 0.0};
        case Axis::Z: return {0.0, 0.0, 1.0};
    }
    return {1.0, 0.0, 0.0};
}

inline double degrees_to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}

// Right-handed rotation of a point about a coordinate axis through the origin
inline Vec3 rotate_about(const Vec3& p, Axis axis, double angle_rad) {
    const double c = std::cos(angle_rad);
    const double s = std::sin(angle_rad);
    switch (axis) {
        case Axis::X: return {p.x, c * p.y - s * p.z, s * p.y + c * p.z};
        case Axis::Y: return {c * p.x + s * p.z, p.y, -s * p.x + c * p.z};
        case Axis::Z: return {c * p.x - s * p.y, s * p.x + c * p.y, p.z};
    }
    return p;
}

namespace vec3 {
    constexpr Vec3 zero() { return {0.0, 0.0, 0.0}; }
}

}  // namespace magnetmesh

#endif // MAGNETMESH_MATH_VEC3_HPP
