#include "pipelines.hpp"

#include <common/errors.hpp>
#include <common/logging.hpp>
#include <compiler/boundaries.hpp>
#include <naming/physical_groups.hpp>
#include <serialization/model_json.hpp>
#include <serialization/report_json.hpp>
#include <sizing/mesh_sizing_policy.hpp>
#include <transform/mesh_rotation.hpp>

#include <algorithm>
#include <filesystem>
#include <string>

namespace magnetmesh {

namespace {

double default_length(const AxiExtent& domain) {
    return std::max(domain.r_max, domain.z_max - domain.z_min) / 10.0;
}

void set_scaling(Kernel& kernel, const MeshOptions& mesh_options) {
    if (mesh_options.scaling != 1.0) {
        kernel.set_option("Mesh.ScalingFactor", mesh_options.scaling);
    }
}

// Sizing and meshing shared by the compile pipelines. Lengths stay in model
// units; the writer applies the scaling factor.
std::size_t mesh_compiled(KernelSession& session, const GeometryModel& model,
                          const CompileOptions& options, const MeshOptions& mesh_options,
                          const CompileResult& result) {
    MeshSizingPolicy policy =
        MeshSizingPolicy::from_model(model, options.air, default_length(result.domain));
    for (const auto& rule : mesh_options.rules) {
        policy.add_rule(rule);
    }
    return session.guarded(session.model_name(), [&](Kernel& k) {
        set_scaling(k, mesh_options);
        std::size_t sized =
            apply_sizes(k, policy, result.registry, result.lineage, result.dim, 1.0);
        generate(k, mesh_options, result.dim, 1.0);
        return sized;
    });
}

// Rotates the generated mesh when asked and writes it
std::string write_mesh(KernelSession& session, const TransformSpec& transform,
                       const std::string& output_path) {
    if (output_path.empty()) {
        return {};
    }
    return session.guarded(session.model_name(), [&](Kernel& k) {
        std::string path = output_path;
        if (transform.rotation_angle) {
            Mesh rotated = rotate_mesh(k.read_mesh(), *transform.rotation_angle,
                                       transform.rotation_axis);
            k.update_nodes(rotated);
            path = rotated_output_path(output_path, *transform.rotation_angle);
        }
        k.write(path);
        logging::get_logger()->info("Wrote mesh to {}", path);
        return path;
    });
}

}  // namespace

std::string rotated_output_path(const std::string& path, double degrees) {
    std::filesystem::path p(path);
    std::filesystem::path name = rotated_mesh_name(p.stem().string(), degrees);
    name += p.extension();
    return (p.parent_path() / name).string();
}

MeshRun compile_to_mesh(const KernelFactory& factory, const GeometryModel& model,
                        const CompileOptions& options, const MeshOptions& mesh_options,
                        const std::string& output_path) {
    mesh_options.validate();
    KernelSession session(factory, model.root);

    MeshRun run;
    run.compile = GeometryCompiler(session, options).compile(model);
    {
        logging::StageTimer timer("Stage 7: mesh");
        run.sized_points = mesh_compiled(session, model, options, mesh_options, run.compile);
    }
    run.mesh_path = write_mesh(session, options.transform, output_path);
    return run;
}

MeshRun compile_file(const KernelFactory& factory, const std::string& model_path,
                     const std::string& config_path, const std::string& output_path,
                     const std::string& report_path) {
    auto log = logging::get_logger();
    GeometryModel model = model_from_json(json::read_json_file(model_path));

    CompileOptions options;
    MeshOptions mesh_options;
    if (!config_path.empty()) {
        const nlohmann::json config = json::read_json_file(config_path);
        try {
            options = config.value("compile", nlohmann::json::object()).get<CompileOptions>();
            mesh_options = config.value("mesh", nlohmann::json::object()).get<MeshOptions>();
        } catch (const nlohmann::json::exception& e) {
            throw ValidationError("malformed configuration in " + config_path + ": " + e.what());
        }
    }
    log->info("Compiling '{}' from {}", model.root, model_path);

    MeshRun run = compile_to_mesh(factory, model, options, mesh_options, output_path);
    if (!report_path.empty()) {
        json::Report report = compile_report(run.compile, options, model.root, model_path);
        report.stats["sized_points"] = run.sized_points;
        report.data["mesh"] = run.mesh_path;
        json::write_report(report_path, report);
        log->info("Report written to {}", report_path);
    }
    return run;
}

MeshRun generate_sector(const KernelFactory& factory, const GeometryModel& model,
                        const CompileOptions& options, const MeshOptions& mesh_options,
                        SectorMethod method, const std::string& output_path) {
    auto log = logging::get_logger();
    if (options.mode != CompileMode::Full3D) {
        throw ValidationError("sectors are generated from 3D assemblies only");
    }
    options.validate();
    mesh_options.validate();
    KernelSession session(factory, model.root);

    MeshRun run;
    if (method == SectorMethod::Revolve) {
        run.compile = GeometryCompiler(session, options).compile(model);
    } else {
        CompileOptions full = options;
        full.transform.sector_count = 1;
        full.transform.revolution_angle = 360.0;
        run.compile = GeometryCompiler(session, full).compile(model);

        logging::StageTimer timer("Stage 7: slice");
        CompileResult& result = run.compile;
        run.slice = slice_to_sector(session, result.registry, result.lineage, options.transform,
                                    result.domain);
        session.guarded(session.model_name(), [&](Kernel& k) {
            refresh_boundaries(k, result.registry, result.lineage, result.boundaries,
                               {true, 360.0}, result.eps, result.warnings);
            bind_symmetry_planes(k, result.registry, result.lineage, run.slice->angle,
                                 result.domain, result.eps, result.warnings);
            k.remove_physical_groups();
            result.unresolved = result.lineage.unresolved(k.entities(result.dim));
            result.groups = flatten(result.registry, result.lineage, options.grouping);
            apply(k, result.groups);
        });
        log->info("Sliced '{}' to a {} degree sector: {} solids checked", model.root,
                  run.slice->angle, run.slice->solids.size());
    }
    {
        logging::StageTimer timer("Stage 8: mesh");
        run.sized_points = mesh_compiled(session, model, options, mesh_options, run.compile);
    }
    run.mesh_path = write_mesh(session, options.transform, output_path);
    return run;
}

RotationRun rotate_mesh_file(const KernelFactory& factory, const std::string& path,
                             double degrees, Axis axis) {
    KernelSession session(factory, std::filesystem::path(path).stem().string());
    return session.guarded(path, [&](Kernel& k) {
        RotationRun run;
        k.open(path);
        if (!k.has_mesh()) {
            throw ValidationError("'" + path + "' holds no mesh");
        }
        run.mesh = rotate_mesh(k.read_mesh(), degrees, axis);
        k.update_nodes(run.mesh);
        run.mesh_path = rotated_output_path(path, degrees);
        k.write(run.mesh_path);
        logging::get_logger()->info("Rotated {} by {} degrees into {}", path, degrees,
                                    run.mesh_path);
        return run;
    });
}

InterchangeRun interchange_to_mesh(const KernelFactory& factory,
                                   const InterchangeDocument& document,
                                   const ReconcileOptions& options,
                                   const MeshOptions& mesh_options,
                                   const std::string& output_path) {
    auto log = logging::get_logger();
    mesh_options.validate();
    if (document.shape_file.empty()) {
        throw ValidationError("interchange document '" + document.name + "' names no shape file");
    }
    KernelSession session(factory, document.name);

    InterchangeRun run;
    {
        logging::StageTimer timer("Stage 1: import");
        session.guarded(document.shape_file, [&](Kernel& k) {
            // Imported unscaled so locators and shapes share units
            k.import_shapes(document.shape_file);
            k.synchronize();
        });
    }
    {
        logging::StageTimer timer("Stage 2: reconcile");
        run.reconcile = InterchangeReconciler(options).reconcile(session.kernel(), document);
    }

    logging::StageTimer timer("Stage 3: mesh");
    const ReconcileResult& result = run.reconcile;
    run.sized_points = session.guarded(document.name, [&](Kernel& k) {
        k.remove_physical_groups();
        apply(k, result.groups);

        BoundingBox extent;
        for (const auto& entity : k.entities(result.dim)) {
            extent.merge(k.bounding_box(entity));
        }
        if (extent.empty()) {
            throw ValidationError("'" + document.shape_file + "' holds no entity of dimension " +
                                  std::to_string(result.dim));
        }
        MeshSizingPolicy policy(extent.diagonal() / 20.0);
        for (const auto& rule : mesh_options.rules) {
            policy.add_rule(rule);
        }
        set_scaling(k, mesh_options);
        std::size_t sized =
            apply_sizes(k, policy, result.registry, result.lineage, result.dim, 1.0);
        generate(k, mesh_options, result.dim, 1.0);
        return sized;
    });

    if (!output_path.empty()) {
        session.guarded(document.name, [&](Kernel& k) { k.write(output_path); });
        run.mesh_path = output_path;
        log->info("Wrote mesh to {}", output_path);
    }
    return run;
}

}  // namespace magnetmesh
