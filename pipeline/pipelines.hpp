#ifndef MAGNETMESH_PIPELINE_PIPELINES_HPP
#define MAGNETMESH_PIPELINE_PIPELINES_HPP

#include <compiler/compile_options.hpp>
#include <compiler/geometry_compiler.hpp>
#include <interchange/interchange_document.hpp>
#include <interchange/interchange_reconciler.hpp>
#include <kernel/kernel_session.hpp>
#include <kernel/mesh.hpp>
#include <model/geometry_model.hpp>
#include <sizing/mesh_generator.hpp>
#include <transform/symmetry_reduction.hpp>

#include <optional>
#include <string>

namespace magnetmesh {

// Each pipeline opens one kernel session from the factory and releases it
// when it returns or throws. An empty output path skips writing.

struct MeshRun {
    CompileResult compile;
    std::optional<SliceReport> slice;
    std::size_t sized_points = 0;
    std::string mesh_path;
};

// Compiles the model, sizes and meshes it. With a rotation angle in the
// transform spec the mesh is rotated and written under the suffixed name.
MeshRun compile_to_mesh(const KernelFactory& factory, const GeometryModel& model,
                        const CompileOptions& options, const MeshOptions& mesh_options,
                        const std::string& output_path);

enum class SectorMethod {
    Revolve,   // revolve the profile straight into the wedge
    Slice      // build the full assembly then keep the wedge
};

// Meshes the [0, 360/k] sector of a 3D assembly
MeshRun generate_sector(const KernelFactory& factory, const GeometryModel& model,
                        const CompileOptions& options, const MeshOptions& mesh_options,
                        SectorMethod method, const std::string& output_path);

struct RotationRun {
    Mesh mesh;
    std::string mesh_path;
};

// Reads a mesh file, rotates it and writes "<stem>-rotate-<angle>deg<ext>"
// next to it
RotationRun rotate_mesh_file(const KernelFactory& factory, const std::string& path,
                             double degrees, Axis axis = Axis::X);

struct InterchangeRun {
    ReconcileResult reconcile;
    std::size_t sized_points = 0;
    std::string mesh_path;
};

// Imports the shapes listed by the document, rebuilds its groups and meshes
// them. Group resolution happens before any meshing.
InterchangeRun interchange_to_mesh(const KernelFactory& factory,
                                   const InterchangeDocument& document,
                                   const ReconcileOptions& options,
                                   const MeshOptions& mesh_options,
                                   const std::string& output_path);

// File driven compile. The configuration file, when given, holds
// {"compile": CompileOptions, "mesh": MeshOptions}; an empty report path
// skips the JSON report.
MeshRun compile_file(const KernelFactory& factory, const std::string& model_path,
                     const std::string& config_path, const std::string& output_path,
                     const std::string& report_path = "");

// Path of the rotated copy of a mesh file
std::string rotated_output_path(const std::string& path, double degrees);

}  // namespace magnetmesh

#endif // MAGNETMESH_PIPELINE_PIPELINES_HPP
