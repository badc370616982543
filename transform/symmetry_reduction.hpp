#ifndef MAGNETMESH_TRANSFORM_SYMMETRY_REDUCTION_HPP
#define MAGNETMESH_TRANSFORM_SYMMETRY_REDUCTION_HPP

#include "transform_spec.hpp"
#include <kernel/kernel_session.hpp>
#include <model/geometry_model.hpp>
#include <naming/entity_lineage.hpp>
#include <naming/naming_registry.hpp>

#include <string>
#include <vector>

namespace magnetmesh {

struct SliceCheck {
    double tolerance = 1e-6;      // relative error allowed on the kept measure
    double sliver_ratio = 1e-3;   // pieces below this share of their solid are slivers
};

// Measure of one named solid before and after slicing
struct SlicedSolid {
    std::string name;
    double before = 0.0;
    double after = 0.0;
};

struct SliceReport {
    double angle = 360.0;
    std::vector<SlicedSolid> solids;
};

// Keeps the [0, 360/k] wedge about y of every named 3D solid. The assembly
// must be rotationally consistent with the sector: a solid that does not
// keep 1/k of its volume, or that leaves a sliver, raises
// KernelOperationError naming it.
SliceReport slice_to_sector(KernelSession& session, const NamingRegistry& registry,
                            EntityLineage& lineage, const TransformSpec& spec,
                            const AxiExtent& domain, const SliceCheck& check = {});

}  // namespace magnetmesh

#endif // MAGNETMESH_TRANSFORM_SYMMETRY_REDUCTION_HPP
