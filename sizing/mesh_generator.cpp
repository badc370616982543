#include "mesh_generator.hpp"

#include <common/errors.hpp>
#include <common/logging.hpp>

#include <algorithm>
#include <map>
#include <utility>

namespace magnetmesh {

namespace {

const std::vector<std::pair<std::string, int>>& algorithms_2d() {
    static const std::vector<std::pair<std::string, int>> table{
        {"MeshAdapt", 1}, {"Automatic", 2}, {"Initial", 3},
        {"Delaunay", 5}, {"Frontal-Delaunay", 6}, {"BAMG", 7}};
    return table;
}

const std::vector<std::pair<std::string, int>>& algorithms_3d() {
    static const std::vector<std::pair<std::string, int>> table{
        {"Delaunay", 1}, {"Initial", 3}, {"Frontal", 4}, {"MMG3D", 7}, {"HXT", 10}};
    return table;
}

int lookup(const std::vector<std::pair<std::string, int>>& table, const std::string& name,
           const char* what) {
    for (const auto& [key, code] : table) {
        if (key == name) return code;
    }
    throw ValidationError(std::string("unknown ") + what + " mesh algorithm '" + name + "'");
}

std::vector<std::string> keys(const std::vector<std::pair<std::string, int>>& table) {
    std::vector<std::string> result;
    for (const auto& [key, code] : table) {
        result.push_back(key);
    }
    return result;
}

}  // namespace

int algorithm_2d(const std::string& name) {
    return lookup(algorithms_2d(), name, "2D");
}

int algorithm_3d(const std::string& name) {
    return lookup(algorithms_3d(), name, "3D");
}

std::vector<std::string> algorithm_names_2d() {
    return keys(algorithms_2d());
}

std::vector<std::string> algorithm_names_3d() {
    return keys(algorithms_3d());
}

void MeshOptions::validate() const {
    algorithm_2d(algo2d);
    algorithm_3d(algo3d);
    if (!(scaling > 0.0)) {
        throw ValidationError("mesh scaling must be positive");
    }
    if (refinement) {
        const auto& r = *refinement;
        if (!(r.size_min > 0.0) || r.size_max < r.size_min) {
            throw ValidationError("refinement sizes must satisfy 0 < min <= max");
        }
        if (r.dist_min < 0.0 || r.dist_max < r.dist_min) {
            throw ValidationError("refinement distances must satisfy 0 <= min <= max");
        }
    }
}

std::size_t apply_sizes(Kernel& kernel, const MeshSizingPolicy& policy,
                        const NamingRegistry& registry, const EntityLineage& lineage, int dim,
                        double unit) {
    auto log = logging::get_logger();
    std::map<DimTag, double> sizes;
    for (const auto& name : registry.names()) {
        if (name.category == Category::Boundary || !lineage.is_bound(name.id) ||
            lineage.canonical(name.id) != name.id || lineage.consumed(name.id)) {
            continue;
        }
        for (const auto& tag : lineage.resolve(name.id)) {
            if (tag.dim != dim) continue;
            double length = policy.resolve(tag.tag, name.path) * unit;
            for (const auto& point : kernel.boundary_points({tag})) {
                auto [it, inserted] = sizes.emplace(point, length);
                if (!inserted) {
                    it->second = std::min(it->second, length);
                }
            }
        }
    }
    for (const auto& [point, length] : sizes) {
        kernel.set_mesh_size({point}, length);
    }
    log->debug("Mesh sizes set on {} points", sizes.size());
    return sizes.size();
}

void generate(Kernel& kernel, const MeshOptions& options, int dim, double unit) {
    auto log = logging::get_logger();
    options.validate();
    kernel.set_option("Mesh.Algorithm", algorithm_2d(options.algo2d));
    if (dim == 3) {
        kernel.set_option("Mesh.Algorithm3D", algorithm_3d(options.algo3d));
    }
    if (options.refinement) {
        const auto& r = *options.refinement;
        kernel.add_refinement_field(r.center * unit, r.size_min * unit, r.size_max * unit,
                                    r.dist_min * unit, r.dist_max * unit);
    }
    log->info("Meshing in {}D with {} / {}", dim, options.algo2d, options.algo3d);
    kernel.generate_mesh(dim);
}

}  // namespace magnetmesh
