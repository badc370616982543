#ifndef MAGNETMESH_COMPILER_GEOMETRY_COMPILER_HPP
#define MAGNETMESH_COMPILER_GEOMETRY_COMPILER_HPP

#include "boundaries.hpp"
#include "build_context.hpp"
#include "compile_options.hpp"
#include <kernel/kernel_session.hpp>
#include <model/geometry_model.hpp>
#include <naming/entity_lineage.hpp>
#include <naming/naming_registry.hpp>
#include <naming/physical_groups.hpp>

#include <string>
#include <vector>

namespace magnetmesh {

// Everything produced by one compilation. Registry and lineage are handed
// over so sizing and group tagging can reuse them.
struct CompileResult {
    PhysicalGroupSet groups;
    NamingRegistry registry;
    EntityLineage lineage;
    int dim = 2;                        // dimension of the compiled solids
    DimTags unresolved;                 // solids no name reaches
    AxiExtent domain;                   // (r, z) extent including air
    std::vector<BoundaryQuery> boundaries;  // re-run after later booleans
    double eps = 1e-8;
    std::vector<std::string> warnings;
};

// Turns a geometry model into named kernel entities and physical groups.
//
// Stages:
//   1. validate options and model, reject unsupported roots
//   2. build every node through the per-kind builders
//   3. fragment against the air box, or against each other for conformity
//   4. revolve the profile (3D)
//   5. resolve boundary names geometrically
//   6. flatten the lineage into physical groups and tag the kernel model
class GeometryCompiler {
public:
    GeometryCompiler(KernelSession& session, CompileOptions options);

    CompileResult compile(const GeometryModel& model);

private:
    void build_air(BuildContext& ctx, AxiExtent& domain);
    void make_conformal(BuildContext& ctx);
    void revolve(BuildContext& ctx, const AxiExtent& domain, const RevolutionFrame& frame);
    void resolve_boundaries(BuildContext& ctx, const RevolutionFrame& frame,
                            std::vector<BoundaryQuery>& queries);

    KernelSession& session_;
    CompileOptions options_;
};

}  // namespace magnetmesh

#endif // MAGNETMESH_COMPILER_GEOMETRY_COMPILER_HPP
