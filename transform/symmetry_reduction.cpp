#include "symmetry_reduction.hpp"

#include <common/errors.hpp>
#include <common/logging.hpp>

#include <cmath>
#include <set>

namespace magnetmesh {

namespace {

double total_mass(const Kernel& kernel, const DimTags& tags) {
    double total = 0.0;
    for (const auto& t : tags) {
        total += kernel.mass(t);
    }
    return total;
}

DimTags volumes_of(const EntityLineage& lineage, NameId id) {
    DimTags result;
    for (const auto& t : lineage.resolve(id)) {
        if (t.dim == 3) result.push_back(t);
    }
    return result;
}

}  // namespace

SliceReport slice_to_sector(KernelSession& session, const NamingRegistry& registry,
                            EntityLineage& lineage, const TransformSpec& spec,
                            const AxiExtent& domain, const SliceCheck& check) {
    auto log = logging::get_logger();
    spec.validate();
    SliceReport report;
    report.angle = spec.sector_angle();
    if (spec.sector_count == 1) {
        return report;
    }

    std::vector<NameId> names;
    for (const auto& name : registry.names()) {
        if (lineage.is_bound(name.id) && lineage.canonical(name.id) == name.id &&
            !lineage.consumed(name.id) && !volumes_of(lineage, name.id).empty()) {
            names.push_back(name.id);
        }
    }

    session.guarded(session.model_name(), [&](Kernel& k) {
        std::set<DimTag> objects;
        for (NameId id : names) {
            const DimTags volumes = volumes_of(lineage, id);
            report.solids.push_back({registry.get(id).path, total_mass(k, volumes), 0.0});
            objects.insert(volumes.begin(), volumes.end());
        }

        const double margin = 0.01 * std::max(domain.r_max, domain.z_max - domain.z_min);
        int wedge = k.add_wedge(0.0, domain.r_max + margin, domain.z_min - margin,
                                domain.z_max + margin, report.angle);
        const DimTags inputs(objects.begin(), objects.end());
        OperationRecord rec = lineage.record(BooleanOp::Intersect, inputs, {{3, wedge}}, true, k);
        BooleanResult result = k.boolean(BooleanOp::Intersect, inputs, {{3, wedge}}, true);
        k.synchronize();
        lineage.rebind_after_operation(rec, result);
    });

    Kernel& k = session.kernel();
    const double share = 1.0 / spec.sector_count;
    for (std::size_t i = 0; i < names.size(); ++i) {
        SlicedSolid& solid = report.solids[i];
        const DimTags pieces = volumes_of(lineage, names[i]);
        solid.after = total_mass(k, pieces);
        const double expected = solid.before * share;
        if (std::abs(solid.after - expected) > check.tolerance * solid.before) {
            session.mark_failed("inconsistent sector slice");
            throw KernelOperationError("sector of " + std::to_string(report.angle) +
                                       " degrees keeps " + std::to_string(solid.after) +
                                       " of " + std::to_string(solid.before) +
                                       ", the solid is not rotationally consistent",
                                       solid.name);
        }
        for (const auto& piece : pieces) {
            if (k.mass(piece) < check.sliver_ratio * expected) {
                session.mark_failed("sliver left by sector slice");
                throw KernelOperationError("sector slice leaves a sliver (volume " +
                                           std::to_string(piece.tag) + ")", solid.name);
            }
        }
    }
    log->info("Sliced {} solids to a {} degree sector", names.size(), report.angle);
    return report;
}

}  // namespace magnetmesh
