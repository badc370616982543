#ifndef MAGNETMESH_COMPILER_BUILD_CONTEXT_HPP
#define MAGNETMESH_COMPILER_BUILD_CONTEXT_HPP

#include "boundaries.hpp"
#include "compile_options.hpp"
#include <kernel/kernel_session.hpp>
#include <model/geometry_model.hpp>
#include <naming/entity_lineage.hpp>
#include <naming/naming_registry.hpp>

#include <string>
#include <utility>
#include <vector>

namespace magnetmesh {

// Mutable state shared by the per-kind builders during one compilation
struct BuildContext {
    KernelSession& session;
    const GeometryModel& model;
    const CompileOptions& options;
    NamingRegistry& registry;
    EntityLineage& lineage;

    std::vector<NameId> solids;                                // named solids, build order
    std::vector<BoundarySpec> boundaries;                      // resolved once geometry is final
    std::vector<std::pair<NameId, ProfileSegment>> curves;     // named profile curves
    std::vector<std::string> warnings;
    double eps = 1e-8;                                         // geometric tolerance

    Kernel& kernel() { return session.kernel(); }

    // Registers a solid and binds the surface just built
    const SemanticName& add_solid(const std::vector<std::string>& path, Category category,
                                  int surface, bool indexed = false);
    // Live tags of every named solid
    DimTags solid_tags() const;
};

// Runs a boolean through the lineage: snapshot, kernel call, rebind
BooleanResult run_boolean(BuildContext& ctx, BooleanOp op, const DimTags& objects,
                          const DimTags& tools, bool remove_tool = true);

// Path prefix extended by one segment
std::vector<std::string> child_path(const std::vector<std::string>& prefix,
                                    const std::string& segment);

}  // namespace magnetmesh

#endif // MAGNETMESH_COMPILER_BUILD_CONTEXT_HPP
