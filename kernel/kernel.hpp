#ifndef MAGNETMESH_KERNEL_KERNEL_HPP
#define MAGNETMESH_KERNEL_KERNEL_HPP

#include "mesh.hpp"
#include <math/bounding_box.hpp>
#include <math/vec3.hpp>

#include <string>
#include <utility>
#include <vector>

namespace magnetmesh {

// Kernel entity identity: (dimension, tag)
struct DimTag {
    int dim = 0;
    int tag = 0;

    bool operator==(const DimTag& other) const = default;
    bool operator<(const DimTag& other) const {
        return dim != other.dim ? dim < other.dim : tag < other.tag;
    }
};

using DimTags = std::vector<DimTag>;

enum class BooleanOp { Fuse, Cut, Fragment, Intersect };

std::string boolean_op_name(BooleanOp op);

// Output of a boolean operation; ancestry[i] lists the output entities derived
// from the i-th input, inputs ordered as objects then tools
struct BooleanResult {
    DimTags out;
    std::vector<DimTags> ancestry;
};

// Physical group as stored in the kernel model
struct KernelGroup {
    int dim = 0;
    int tag = 0;
    std::string name;
    std::vector<int> entities;
};

// Geometric kernel consumed by the compiler. Profiles live in the (x=r, y=z)
// plane; the magnet axis is y. Implementations report failures as
// KernelOperationError.
class Kernel {
public:
    virtual ~Kernel() = default;

    virtual void new_model(const std::string& name) = 0;

    // Construction
    virtual int add_rectangle(double x, double y, double dx, double dy) = 0;
    virtual int add_polygon(const std::vector<Vec3>& points) = 0;
    virtual int add_segment(const Vec3& a, const Vec3& b) = 0;
    // Planar annular sector centered on the origin, angles in degrees from x
    virtual int add_annular_sector(double r0, double r1, double theta0, double theta1) = 0;
    // Solid of revolution about y spanning [0, angle] degrees
    virtual int add_wedge(double r0, double r1, double y0, double y1, double angle) = 0;
    virtual DimTags revolve(const DimTags& entities, Axis axis, double angle,
                            std::vector<DimTags>& ancestry) = 0;
    virtual DimTags copy(const DimTags& entities) = 0;
    virtual void rotate(const DimTags& entities, Axis axis, double angle) = 0;
    virtual void remove(const DimTags& entities, bool recursive) = 0;

    // Booleans with traceable ancestry
    virtual BooleanResult boolean(BooleanOp op, const DimTags& objects, const DimTags& tools,
                                  bool remove_tool) = 0;
    virtual void synchronize() = 0;

    // Queries
    virtual DimTags entities(int dim) const = 0;
    virtual DimTags entities_in_box(const BoundingBox& box, int dim) const = 0;
    virtual DimTags boundary_points(const DimTags& entities) const = 0;
    virtual BoundingBox bounding_box(const DimTag& entity) const = 0;
    virtual Vec3 center_of_mass(const DimTag& entity) const = 0;
    virtual double mass(const DimTag& entity) const = 0;

    // Physical groups
    virtual int add_physical_group(int dim, const std::vector<int>& tags, const std::string& name) = 0;
    virtual std::vector<KernelGroup> physical_groups() const = 0;
    virtual void remove_physical_groups() = 0;

    // Meshing
    virtual void set_option(const std::string& name, double value) = 0;
    virtual void set_mesh_size(const DimTags& points, double size) = 0;
    // Distance/threshold refinement around a point
    virtual void add_refinement_field(const Vec3& center, double size_min, double size_max,
                                      double dist_min, double dist_max) = 0;
    virtual void generate_mesh(int dim) = 0;
    virtual bool has_mesh() const = 0;
    virtual Mesh read_mesh() const = 0;
    virtual void update_nodes(const Mesh& mesh) = 0;

    // Files
    virtual DimTags import_shapes(const std::string& path) = 0;
    virtual void open(const std::string& path) = 0;
    virtual void write(const std::string& path) = 0;
};

}  // namespace magnetmesh

#endif // MAGNETMESH_KERNEL_KERNEL_HPP
