#include "geometry_compiler.hpp"

#include "axi_builders.hpp"
#include "sector_builder.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <model/validation.hpp>

#include <algorithm>
#include <cmath>

namespace magnetmesh {

GeometryCompiler::GeometryCompiler(KernelSession& session, CompileOptions options)
    : session_(session), options_(std::move(options)) {}

CompileResult GeometryCompiler::compile(const GeometryModel& model) {
    auto log = logging::get_logger();

    // Stage 1: validation errors surface unchanged
    options_.validate();
    validate(model);
    const GeometryNode& root = model.root_node();
    const GeometryKind kind = kind_of(root);
    if (kind == GeometryKind::Ring || kind == GeometryKind::Screen) {
        throw UnsupportedGeometryKind(kind_name(kind), "'" + name_of(root) +
                                                       "' cannot be compiled on its own");
    }
    if (options_.mode == CompileMode::Sector2D && kind != GeometryKind::Bitter) {
        throw UnsupportedGeometryKind(kind_name(kind),
                                      "planar sectors are only built for Bitter plates");
    }

    log->info("Compiling {} '{}' in {} mode", kind_name(kind), name_of(root),
              mode_name(options_.mode));

    CompileResult result;
    BuildContext ctx{session_, model, options_, result.registry, result.lineage};
    AxiExtent domain = model.extent(root);
    ctx.eps = options_.boundary_tolerance *
              std::max(domain.r_max, domain.z_max - domain.z_min);

    // Stage 2: per-kind construction
    {
        logging::StageTimer timer("Stage 2: build");
        if (options_.mode == CompileMode::Sector2D) {
            build_sector(ctx, std::get<Bitter>(root), {});
        } else {
            build_node(ctx, root, {});
        }
        log->debug("Stage 2: {} names registered, {} solids", result.registry.size(),
                   ctx.solids.size());
    }

    RevolutionFrame frame;
    if (options_.mode != CompileMode::Sector2D) {
        // Stage 3: air or conformity
        {
            logging::StageTimer timer("Stage 3: fragment");
            if (options_.air) {
                build_air(ctx, domain);
            } else {
                make_conformal(ctx);
            }
        }

        // Stage 4: revolution
        if (options_.mode == CompileMode::Full3D) {
            logging::StageTimer timer("Stage 4: revolve");
            frame = {true, options_.transform.sector_angle()};
            revolve(ctx, domain, frame);
        }

        // Stage 5: boundaries
        {
            logging::StageTimer timer("Stage 5: boundaries");
            resolve_boundaries(ctx, frame, result.boundaries);
        }
    }

    // Stage 6: physical groups
    Kernel& k = session_.kernel();
    k.synchronize();
    result.dim = frame.revolved ? 3 : 2;
    result.domain = domain;
    result.eps = ctx.eps;
    result.unresolved = result.lineage.unresolved(k.entities(result.dim));
    if (!result.unresolved.empty()) {
        log->warn("{} entities of dimension {} are not reached by any name",
                  result.unresolved.size(), result.dim);
    }
    result.groups = flatten(result.registry, result.lineage, options_.grouping);
    apply(k, result.groups);
    result.warnings = std::move(ctx.warnings);

    log->info("Compiled '{}': {} names, {} physical groups ({} conductors, {} channels, "
              "{} isolants), {} warnings",
              name_of(root), result.registry.size(), result.groups.size(),
              result.groups.count(Category::Conductor), result.groups.count(Category::Channel),
              result.groups.count(Category::Isolant), result.warnings.size());
    return result;
}

void GeometryCompiler::build_air(BuildContext& ctx, AxiExtent& domain) {
    const AirOptions& air = *options_.air;
    const double r_max = domain.r_max * air.r_ratio;
    const double z0 = domain.z_min * air.z_ratio;
    const double z1 = z0 + std::abs(domain.z_max - domain.z_min) * air.z_ratio;

    session_.guarded("Air", [&](Kernel& k) {
        DimTags solids = ctx.solid_tags();
        int box = k.add_rectangle(0.0, z0, r_max, z1 - z0);
        const auto& name = ctx.registry.register_name({"Air"}, Category::Air, 2, true);
        ctx.lineage.bind(name, {{2, box}});
        ctx.solids.push_back(name.id);
        run_boolean(ctx, BooleanOp::Fragment, {{2, box}}, solids, true);
    });

    if (options_.mode != CompileMode::Full3D) {
        ctx.boundaries.push_back({{"ZAxis"}, Category::Boundary, {{0.0, z0, 0.0, z1}}, false});
    }
    ctx.boundaries.push_back({{"Infty"}, Category::Boundary,
                              {{0.0, z0, r_max, z0}, {r_max, z0, r_max, z1}, {0.0, z1, r_max, z1}},
                              false});
    domain = {0.0, r_max, z0, z1};
    logging::get_logger()->debug("Air box r=[0, {}] z=[{}, {}]", r_max, z0, z1);
}

void GeometryCompiler::make_conformal(BuildContext& ctx) {
    DimTags solids = ctx.solid_tags();
    if (solids.size() < 2) return;
    session_.guarded(session_.model_name(), [&](Kernel&) {
        DimTags tools(solids.begin() + 1, solids.end());
        run_boolean(ctx, BooleanOp::Fragment, {solids.front()}, tools, true);
    });
}

void GeometryCompiler::revolve(BuildContext& ctx, const AxiExtent& domain,
                               const RevolutionFrame& frame) {
    session_.guarded(session_.model_name(), [&](Kernel& k) {
        DimTags inputs = ctx.solid_tags();
        std::vector<DimTags> ancestry;
        k.revolve(inputs, Axis::Y, frame.angle, ancestry);
        k.synchronize();
        ctx.lineage.rebind_mapped(inputs, ancestry);

        if (frame.angle < 360.0) {
            bind_symmetry_planes(k, ctx.registry, ctx.lineage, frame.angle, domain, ctx.eps,
                                 ctx.warnings);
        }
    });
}

void GeometryCompiler::resolve_boundaries(BuildContext& ctx, const RevolutionFrame& frame,
                                          std::vector<BoundaryQuery>& queries) {
    auto log = logging::get_logger();
    Kernel& k = session_.kernel();
    k.synchronize();
    const int dim = frame.revolved ? 2 : 1;

    // Named curves may have been renumbered by later booleans
    std::vector<BoundaryQuery> curves;
    for (const auto& [id, segment] : ctx.curves) {
        curves.push_back({id, {segment}});
    }
    refresh_boundaries(k, ctx.registry, ctx.lineage, curves, frame, ctx.eps, ctx.warnings);
    queries = curves;

    std::size_t resolved = 0;
    for (const auto& spec : ctx.boundaries) {
        DimTags tags = find_boundaries(k, spec.segments, frame, ctx.eps);
        const std::string path = join_path(spec.path);
        if (tags.empty()) {
            log->warn("Boundary '{}' matches no entity", path);
            ctx.warnings.push_back("boundary '" + path + "' matches no entity");
            continue;
        }
        const auto& name = spec.indexed
                               ? ctx.registry.register_indexed(spec.path, spec.category, dim)
                               : ctx.registry.register_name(spec.path, spec.category, dim);
        ctx.lineage.bind(name, tags);
        queries.push_back({name.id, spec.segments});
        ++resolved;
    }
    log->debug("Resolved {}/{} boundaries and {} named curves", resolved, ctx.boundaries.size(),
               ctx.curves.size());
}

}  // namespace magnetmesh
