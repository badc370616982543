#ifndef MAGNETMESH_SIZING_MESH_GENERATOR_HPP
#define MAGNETMESH_SIZING_MESH_GENERATOR_HPP

#include "mesh_sizing_policy.hpp"
#include <kernel/kernel.hpp>
#include <naming/entity_lineage.hpp>
#include <naming/naming_registry.hpp>

#include <optional>
#include <string>
#include <vector>

namespace magnetmesh {

// Distance/threshold refinement around a point
struct RefinementOptions {
    Vec3 center;
    double size_min = 0.0;
    double size_max = 0.0;
    double dist_min = 0.0;
    double dist_max = 0.0;
};

struct MeshOptions {
    std::string algo2d = "Delaunay";
    std::string algo3d = "Delaunay";
    double scaling = 1.0;                       // 0.001 for mm to m
    std::optional<RefinementOptions> refinement;
    std::vector<SizingRule> rules;              // on top of the model defaults

    void validate() const;
};

// Kernel codes of the named algorithms; ValidationError for unknown names
int algorithm_2d(const std::string& name);
int algorithm_3d(const std::string& name);
std::vector<std::string> algorithm_names_2d();
std::vector<std::string> algorithm_names_3d();

// Sets a size on the boundary points of every named solid of dimension dim,
// each length multiplied by unit. A point shared by several solids takes the
// smallest length. Returns the number of points sized.
std::size_t apply_sizes(Kernel& kernel, const MeshSizingPolicy& policy,
                        const NamingRegistry& registry, const EntityLineage& lineage, int dim,
                        double unit);

// Selects the algorithms, adds the refinement field and meshes up to dim
void generate(Kernel& kernel, const MeshOptions& options, int dim, double unit);

}  // namespace magnetmesh

#endif // MAGNETMESH_SIZING_MESH_GENERATOR_HPP
