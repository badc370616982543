#ifndef MAGNETMESH_SERIALIZATION_CONFIG_JSON_HPP
#define MAGNETMESH_SERIALIZATION_CONFIG_JSON_HPP

#include <common/errors.hpp>
#include <compiler/compile_options.hpp>
#include <math/vec3.hpp>
#include <sizing/mesh_generator.hpp>
#include <sizing/mesh_sizing_policy.hpp>
#include <transform/transform_spec.hpp>

#include <nlohmann/json.hpp>
#include <string>

namespace magnetmesh {

// Vec3 serialization
inline void to_json(nlohmann::json& j, const Vec3& v) {
    j = nlohmann::json::array({v.x, v.y, v.z});
}

inline void from_json(const nlohmann::json& j, Vec3& v) {
    v.x = j.at(0).get<double>();
    v.y = j.at(1).get<double>();
    v.z = j.at(2).get<double>();
}

inline std::string axis_name(Axis axis) {
    switch (axis) {
        case Axis::X: return "x";
        case Axis::Y: return "y";
        case Axis::Z: return "z";
    }
    return "x";
}

inline Axis axis_from_name(const std::string& name) {
    if (name == "x") return Axis::X;
    if (name == "y") return Axis::Y;
    if (name == "z") return Axis::Z;
    throw ValidationError("unknown rotation axis '" + name + "'");
}

inline CompileMode mode_from_name(const std::string& name) {
    if (name == "3D") return CompileMode::Full3D;
    if (name == "Axi") return CompileMode::Axisymmetric2D;
    if (name == "2D") return CompileMode::Sector2D;
    throw ValidationError("unknown compile mode '" + name + "'");
}

// TransformSpec serialization
inline void to_json(nlohmann::json& j, const TransformSpec& spec) {
    j = {
        {"revolution_angle", spec.revolution_angle},
        {"sector_count", spec.sector_count},
        {"rotation_axis", axis_name(spec.rotation_axis)}
    };
    if (spec.rotation_angle) j["rotation_angle"] = *spec.rotation_angle;
}

inline void from_json(const nlohmann::json& j, TransformSpec& spec) {
    spec.revolution_angle = j.value("revolution_angle", 360.0);
    spec.sector_count = j.value("sector_count", 1);
    spec.rotation_axis = axis_from_name(j.value("rotation_axis", "x"));
    if (j.contains("rotation_angle")) spec.rotation_angle = j["rotation_angle"].get<double>();
}

// GroupingOptions serialization
inline void to_json(nlohmann::json& j, const GroupingOptions& grouping) {
    j = {
        {"hide_isolants", grouping.hide_isolants},
        {"group_isolants", grouping.group_isolants},
        {"group_channels", grouping.group_channels}
    };
}

inline void from_json(const nlohmann::json& j, GroupingOptions& grouping) {
    grouping.hide_isolants = j.value("hide_isolants", false);
    grouping.group_isolants = j.value("group_isolants", false);
    grouping.group_channels = j.value("group_channels", false);
}

// CompileOptions serialization
inline void to_json(nlohmann::json& j, const CompileOptions& options) {
    j = {
        {"mode", mode_name(options.mode)},
        {"thick_channels", options.thick_channels},
        {"grouping", options.grouping},
        {"transform", options.transform},
        {"boundary_tolerance", options.boundary_tolerance}
    };
    if (options.air) {
        j["air"] = {{"r_ratio", options.air->r_ratio}, {"z_ratio", options.air->z_ratio}};
    }
}

inline void from_json(const nlohmann::json& j, CompileOptions& options) {
    options.mode = mode_from_name(j.value("mode", "Axi"));
    options.thick_channels = j.value("thick_channels", false);
    options.grouping = j.value("grouping", GroupingOptions{});
    options.transform = j.value("transform", TransformSpec{});
    options.boundary_tolerance = j.value("boundary_tolerance", 1e-5);
    if (j.contains("air")) {
        const auto& air = j["air"];
        options.air = AirOptions{air.value("r_ratio", 1.5), air.value("z_ratio", 1.5)};
    }
}

// SizingRule serialization
inline void to_json(nlohmann::json& j, const SizingRule& rule) {
    j = {{"scope", scope_name(rule.scope)}, {"length", rule.length}};
    if (rule.scope == SizingScope::Component) j["target"] = rule.target;
    if (rule.scope == SizingScope::Surface) j["surface"] = rule.surface;
}

inline void from_json(const nlohmann::json& j, SizingRule& rule) {
    std::string scope = j.value("scope", "global");
    if (scope == "global") {
        rule.scope = SizingScope::Global;
    } else if (scope == "component") {
        rule.scope = SizingScope::Component;
    } else if (scope == "surface") {
        rule.scope = SizingScope::Surface;
    } else {
        throw ValidationError("unknown mesh size scope '" + scope + "'");
    }
    rule.target = j.value("target", "");
    rule.surface = j.value("surface", 0);
    rule.length = j.value("length", 0.0);
}

// MeshOptions serialization
inline void to_json(nlohmann::json& j, const MeshOptions& options) {
    j = {
        {"algo2d", options.algo2d},
        {"algo3d", options.algo3d},
        {"scaling", options.scaling},
        {"rules", options.rules}
    };
    if (options.refinement) {
        const auto& r = *options.refinement;
        j["refinement"] = {
            {"center", r.center},
            {"size_min", r.size_min},
            {"size_max", r.size_max},
            {"dist_min", r.dist_min},
            {"dist_max", r.dist_max}
        };
    }
}

inline void from_json(const nlohmann::json& j, MeshOptions& options) {
    options.algo2d = j.value("algo2d", "Delaunay");
    options.algo3d = j.value("algo3d", "Delaunay");
    options.scaling = j.value("scaling", 1.0);
    options.rules = j.value("rules", std::vector<SizingRule>{});
    if (j.contains("refinement")) {
        const auto& r = j["refinement"];
        RefinementOptions refinement;
        refinement.center = r.value("center", Vec3{});
        refinement.size_min = r.value("size_min", 0.0);
        refinement.size_max = r.value("size_max", 0.0);
        refinement.dist_min = r.value("dist_min", 0.0);
        refinement.dist_max = r.value("dist_max", 0.0);
        options.refinement = refinement;
    }
}

}  // namespace magnetmesh

#endif // MAGNETMESH_SERIALIZATION_CONFIG_JSON_HPP
