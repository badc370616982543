#ifndef MAGNETMESH_KERNEL_GMSH_KERNEL_HPP
#define MAGNETMESH_KERNEL_GMSH_KERNEL_HPP

#include "kernel.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace magnetmesh {

struct GmshSettings {
    bool terminal = false;          // echo kernel messages on stdout
    bool capture_log = true;        // forward kernel messages to our logger
    double occ_scaling = 1.0;       // Geometry.OCCScaling applied on import
};

// Kernel backed by the Gmsh C++ API with the OpenCASCADE factory.
// Construction initializes Gmsh, destruction finalizes it.
class GmshKernel : public Kernel {
public:
    explicit GmshKernel(const GmshSettings& settings = {});
    ~GmshKernel() override;

    GmshKernel(const GmshKernel&) = delete;
    GmshKernel& operator=(const GmshKernel&) = delete;

    void new_model(const std::string& name) override;

    int add_rectangle(double x, double y, double dx, double dy) override;
    int add_polygon(const std::vector<Vec3>& points) override;
    int add_segment(const Vec3& a, const Vec3& b) override;
    int add_annular_sector(double r0, double r1, double theta0, double theta1) override;
    int add_wedge(double r0, double r1, double y0, double y1, double angle) override;
    DimTags revolve(const DimTags& entities, Axis axis, double angle,
                    std::vector<DimTags>& ancestry) override;
    DimTags copy(const DimTags& entities) override;
    void rotate(const DimTags& entities, Axis axis, double angle) override;
    void remove(const DimTags& entities, bool recursive) override;

    BooleanResult boolean(BooleanOp op, const DimTags& objects, const DimTags& tools,
                          bool remove_tool) override;
    void synchronize() override;

    DimTags entities(int dim) const override;
    DimTags entities_in_box(const BoundingBox& box, int dim) const override;
    DimTags boundary_points(const DimTags& entities) const override;
    BoundingBox bounding_box(const DimTag& entity) const override;
    Vec3 center_of_mass(const DimTag& entity) const override;
    double mass(const DimTag& entity) const override;

    int add_physical_group(int dim, const std::vector<int>& tags, const std::string& name) override;
    std::vector<KernelGroup> physical_groups() const override;
    void remove_physical_groups() override;

    void set_option(const std::string& name, double value) override;
    void set_mesh_size(const DimTags& points, double size) override;
    void add_refinement_field(const Vec3& center, double size_min, double size_max,
                              double dist_min, double dist_max) override;
    void generate_mesh(int dim) override;
    bool has_mesh() const override;
    Mesh read_mesh() const override;
    void update_nodes(const Mesh& mesh) override;

    DimTags import_shapes(const std::string& path) override;
    void open(const std::string& path) override;
    void write(const std::string& path) override;

private:
    void flush_log() const;

    GmshSettings settings_;
    std::string model_name_;
    std::vector<int> refinement_fields_;
    mutable std::size_t forwarded_log_lines_ = 0;
};

std::unique_ptr<Kernel> make_gmsh_kernel(const GmshSettings& settings = {});

}  // namespace magnetmesh

#endif // MAGNETMESH_KERNEL_GMSH_KERNEL_HPP
