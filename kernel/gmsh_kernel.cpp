#include "gmsh_kernel.hpp"

#include <common/errors.hpp>
#include <common/logging.hpp>

#include <gmsh.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <set>

namespace magnetmesh {

namespace {

// Gmsh reports errors as exceptions derived from std::exception
template <typename F>
auto kernel_call(const std::string& what, F&& f) -> decltype(f()) {
    try {
        return f();
    } catch (const std::exception& e) {
        throw KernelOperationError(what + " failed: " + e.what(), "");
    }
}

gmsh::vectorpair to_gmsh(const DimTags& dim_tags) {
    gmsh::vectorpair out;
    out.reserve(dim_tags.size());
    for (const auto& dt : dim_tags) {
        out.emplace_back(dt.dim, dt.tag);
    }
    return out;
}

DimTags from_gmsh(const gmsh::vectorpair& pairs) {
    DimTags out;
    out.reserve(pairs.size());
    for (const auto& [dim, tag] : pairs) {
        out.push_back({dim, tag});
    }
    return out;
}

std::vector<int> add_arc_chain(int start, int end, double r, double theta0, double theta1) {
    // Circle arcs must stay below 180 degrees
    int pieces = std::max(1, static_cast<int>(std::ceil(std::abs(theta1 - theta0) / 120.0)));
    int center = gmsh::model::occ::addPoint(0.0, 0.0, 0.0);
    std::vector<int> curves;
    int previous = start;
    for (int i = 1; i <= pieces; ++i) {
        int next = end;
        if (i < pieces) {
            double t = degrees_to_radians(theta0 + (theta1 - theta0) * i / pieces);
            next = gmsh::model::occ::addPoint(r * std::cos(t), r * std::sin(t), 0.0);
        }
        curves.push_back(gmsh::model::occ::addCircleArc(previous, center, next));
        previous = next;
    }
    return curves;
}

}  // namespace

GmshKernel::GmshKernel(const GmshSettings& settings) : settings_(settings) {
    kernel_call("initialize", [&] {
        gmsh::initialize();
        gmsh::option::setNumber("General.Terminal", settings_.terminal ? 1 : 0);
        if (settings_.capture_log) {
            gmsh::logger::start();
        }
    });
}

GmshKernel::~GmshKernel() {
    try {
        flush_log();
        if (settings_.capture_log) {
            gmsh::logger::stop();
        }
        gmsh::finalize();
    } catch (const std::exception& e) {
        logging::get_logger()->error("Gmsh finalize failed: {}", e.what());
    }
}

void GmshKernel::flush_log() const {
    if (!settings_.capture_log) return;
    std::vector<std::string> lines;
    gmsh::logger::get(lines);
    auto log = logging::get_logger();
    for (std::size_t i = forwarded_log_lines_; i < lines.size(); ++i) {
        log->trace("gmsh: {}", lines[i]);
    }
    forwarded_log_lines_ = lines.size();
}

void GmshKernel::new_model(const std::string& name) {
    model_name_ = name;
    kernel_call("add model", [&] { gmsh::model::add(name); });
}

int GmshKernel::add_rectangle(double x, double y, double dx, double dy) {
    return kernel_call("addRectangle", [&] {
        return gmsh::model::occ::addRectangle(x, y, 0.0, dx, dy);
    });
}

int GmshKernel::add_polygon(const std::vector<Vec3>& points) {
    if (points.size() < 3) {
        throw KernelOperationError("polygon needs at least three points", "");
    }
    return kernel_call("addPlaneSurface", [&] {
        std::vector<int> point_tags;
        for (const auto& p : points) {
            point_tags.push_back(gmsh::model::occ::addPoint(p.x, p.y, p.z));
        }
        std::vector<int> lines;
        for (std::size_t i = 0; i < point_tags.size(); ++i) {
            lines.push_back(gmsh::model::occ::addLine(
                point_tags[i], point_tags[(i + 1) % point_tags.size()]));
        }
        int loop = gmsh::model::occ::addCurveLoop(lines);
        return gmsh::model::occ::addPlaneSurface({loop});
    });
}

int GmshKernel::add_segment(const Vec3& a, const Vec3& b) {
    return kernel_call("addLine", [&] {
        int pa = gmsh::model::occ::addPoint(a.x, a.y, a.z);
        int pb = gmsh::model::occ::addPoint(b.x, b.y, b.z);
        return gmsh::model::occ::addLine(pa, pb);
    });
}

int GmshKernel::add_annular_sector(double r0, double r1, double theta0, double theta1) {
    return kernel_call("annular sector", [&] {
        auto point = [](double r, double theta) {
            double t = degrees_to_radians(theta);
            return gmsh::model::occ::addPoint(r * std::cos(t), r * std::sin(t), 0.0);
        };
        int p0 = point(r0, theta0);
        int p1 = point(r1, theta0);
        int p2 = point(r1, theta1);
        int p3 = point(r0, theta1);
        std::vector<int> curves{gmsh::model::occ::addLine(p0, p1)};
        for (int c : add_arc_chain(p1, p2, r1, theta0, theta1)) curves.push_back(c);
        curves.push_back(gmsh::model::occ::addLine(p2, p3));
        for (int c : add_arc_chain(p3, p0, r0, theta1, theta0)) curves.push_back(c);
        int loop = gmsh::model::occ::addCurveLoop(curves);
        return gmsh::model::occ::addPlaneSurface({loop});
    });
}

int GmshKernel::add_wedge(double r0, double r1, double y0, double y1, double angle) {
    int profile = add_rectangle(r0, y0, r1 - r0, y1 - y0);
    std::vector<DimTags> ancestry;
    revolve({{2, profile}}, Axis::Y, angle, ancestry);
    if (ancestry.empty() || ancestry.front().empty()) {
        throw KernelOperationError("revolution produced no solid", "");
    }
    return ancestry.front().front().tag;
}

DimTags GmshKernel::revolve(const DimTags& entities, Axis axis, double angle,
                            std::vector<DimTags>& ancestry) {
    Vec3 a = axis_direction(axis);
    gmsh::vectorpair out;
    kernel_call("revolve", [&] {
        gmsh::model::occ::revolve(to_gmsh(entities), 0.0, 0.0, 0.0, a.x, a.y, a.z,
                                  degrees_to_radians(angle), out);
    });
    // Output lists, per input: top, swept entity, lateral entities
    ancestry.assign(entities.size(), {});
    std::size_t input = 0;
    for (const auto& [dim, tag] : out) {
        if (input < entities.size() && dim == entities[input].dim + 1) {
            ancestry[input].push_back({dim, tag});
            ++input;
        }
    }
    return from_gmsh(out);
}

DimTags GmshKernel::copy(const DimTags& entities) {
    gmsh::vectorpair out;
    kernel_call("copy", [&] { gmsh::model::occ::copy(to_gmsh(entities), out); });
    return from_gmsh(out);
}

void GmshKernel::rotate(const DimTags& entities, Axis axis, double angle) {
    Vec3 a = axis_direction(axis);
    kernel_call("rotate", [&] {
        gmsh::model::occ::rotate(to_gmsh(entities), 0.0, 0.0, 0.0, a.x, a.y, a.z,
                                 degrees_to_radians(angle));
    });
}

void GmshKernel::remove(const DimTags& entities, bool recursive) {
    kernel_call("remove", [&] { gmsh::model::occ::remove(to_gmsh(entities), recursive); });
}

BooleanResult GmshKernel::boolean(BooleanOp op, const DimTags& objects, const DimTags& tools,
                                  bool remove_tool) {
    gmsh::vectorpair out;
    std::vector<gmsh::vectorpair> out_map;
    auto obj = to_gmsh(objects);
    auto tool = to_gmsh(tools);
    kernel_call(boolean_op_name(op), [&] {
        switch (op) {
            case BooleanOp::Fuse:
                gmsh::model::occ::fuse(obj, tool, out, out_map, -1, true, remove_tool);
                break;
            case BooleanOp::Cut:
                gmsh::model::occ::cut(obj, tool, out, out_map, -1, true, remove_tool);
                break;
            case BooleanOp::Fragment:
                gmsh::model::occ::fragment(obj, tool, out, out_map, -1, true, remove_tool);
                break;
            case BooleanOp::Intersect:
                gmsh::model::occ::intersect(obj, tool, out, out_map, -1, true, remove_tool);
                break;
        }
    });

    BooleanResult result;
    result.out = from_gmsh(out);
    for (const auto& children : out_map) {
        result.ancestry.push_back(from_gmsh(children));
    }
    result.ancestry.resize(objects.size() + tools.size());
    flush_log();
    return result;
}

void GmshKernel::synchronize() {
    kernel_call("synchronize", [] { gmsh::model::occ::synchronize(); });
}

DimTags GmshKernel::entities(int dim) const {
    gmsh::vectorpair out;
    kernel_call("getEntities", [&] { gmsh::model::getEntities(out, dim); });
    return from_gmsh(out);
}

DimTags GmshKernel::entities_in_box(const BoundingBox& box, int dim) const {
    gmsh::vectorpair out;
    kernel_call("getEntitiesInBoundingBox", [&] {
        gmsh::model::getEntitiesInBoundingBox(box.min.x, box.min.y, box.min.z,
                                              box.max.x, box.max.y, box.max.z, out, dim);
    });
    return from_gmsh(out);
}

DimTags GmshKernel::boundary_points(const DimTags& entities) const {
    gmsh::vectorpair out;
    kernel_call("getBoundary", [&] {
        gmsh::model::getBoundary(to_gmsh(entities), out, false, false, true);
    });
    DimTags points;
    std::set<DimTag> seen;
    for (const auto& [dim, tag] : out) {
        if (dim == 0 && seen.insert({dim, tag}).second) {
            points.push_back({dim, tag});
        }
    }
    return points;
}

BoundingBox GmshKernel::bounding_box(const DimTag& entity) const {
    double xmin = 0, ymin = 0, zmin = 0, xmax = 0, ymax = 0, zmax = 0;
    kernel_call("getBoundingBox", [&] {
        gmsh::model::getBoundingBox(entity.dim, entity.tag, xmin, ymin, zmin, xmax, ymax, zmax);
    });
    return BoundingBox::from_corners({xmin, ymin, zmin}, {xmax, ymax, zmax});
}

Vec3 GmshKernel::center_of_mass(const DimTag& entity) const {
    Vec3 c;
    kernel_call("getCenterOfMass", [&] {
        gmsh::model::occ::getCenterOfMass(entity.dim, entity.tag, c.x, c.y, c.z);
    });
    return c;
}

double GmshKernel::mass(const DimTag& entity) const {
    double m = 0.0;
    kernel_call("getMass", [&] { gmsh::model::occ::getMass(entity.dim, entity.tag, m); });
    return m;
}

int GmshKernel::add_physical_group(int dim, const std::vector<int>& tags, const std::string& name) {
    return kernel_call("addPhysicalGroup " + name, [&] {
        return gmsh::model::addPhysicalGroup(dim, tags, -1, name);
    });
}

std::vector<KernelGroup> GmshKernel::physical_groups() const {
    std::vector<KernelGroup> groups;
    kernel_call("getPhysicalGroups", [&] {
        gmsh::vectorpair dim_tags;
        gmsh::model::getPhysicalGroups(dim_tags);
        for (const auto& [dim, tag] : dim_tags) {
            KernelGroup group;
            group.dim = dim;
            group.tag = tag;
            gmsh::model::getPhysicalName(dim, tag, group.name);
            gmsh::model::getEntitiesForPhysicalGroup(dim, tag, group.entities);
            groups.push_back(std::move(group));
        }
    });
    return groups;
}

void GmshKernel::remove_physical_groups() {
    kernel_call("removePhysicalGroups", [] { gmsh::model::removePhysicalGroups(); });
}

void GmshKernel::set_option(const std::string& name, double value) {
    kernel_call("option " + name, [&] { gmsh::option::setNumber(name, value); });
}

void GmshKernel::set_mesh_size(const DimTags& points, double size) {
    kernel_call("setSize", [&] { gmsh::model::mesh::setSize(to_gmsh(points), size); });
}

void GmshKernel::add_refinement_field(const Vec3& center, double size_min, double size_max,
                                      double dist_min, double dist_max) {
    kernel_call("refinement field", [&] {
        int point = gmsh::model::occ::addPoint(center.x, center.y, center.z);
        gmsh::model::occ::synchronize();
        int distance = gmsh::model::mesh::field::add("Distance");
        gmsh::model::mesh::field::setNumbers(distance, "PointsList", {static_cast<double>(point)});
        int threshold = gmsh::model::mesh::field::add("Threshold");
        gmsh::model::mesh::field::setNumber(threshold, "InField", distance);
        gmsh::model::mesh::field::setNumber(threshold, "SizeMin", size_min);
        gmsh::model::mesh::field::setNumber(threshold, "SizeMax", size_max);
        gmsh::model::mesh::field::setNumber(threshold, "DistMin", dist_min);
        gmsh::model::mesh::field::setNumber(threshold, "DistMax", dist_max);
        refinement_fields_.push_back(threshold);

        int background = threshold;
        if (refinement_fields_.size() > 1) {
            background = gmsh::model::mesh::field::add("Min");
            std::vector<double> fields(refinement_fields_.begin(), refinement_fields_.end());
            gmsh::model::mesh::field::setNumbers(background, "FieldsList", fields);
        }
        gmsh::model::mesh::field::setAsBackgroundMesh(background);
    });
}

void GmshKernel::generate_mesh(int dim) {
    kernel_call("mesh generation", [&] { gmsh::model::mesh::generate(dim); });
    flush_log();
}

bool GmshKernel::has_mesh() const {
    std::vector<std::size_t> tags;
    std::vector<double> coords, params;
    kernel_call("getNodes", [&] { gmsh::model::mesh::getNodes(tags, coords, params); });
    return !tags.empty();
}

Mesh GmshKernel::read_mesh() const {
    Mesh mesh;
    mesh.name = model_name_;
    kernel_call("read mesh", [&] {
        std::vector<std::size_t> node_tags;
        std::vector<double> coords, params;
        gmsh::model::mesh::getNodes(node_tags, coords, params, -1, -1, true, false);
        mesh.nodes.reserve(node_tags.size());
        for (std::size_t i = 0; i < node_tags.size(); ++i) {
            mesh.nodes.push_back({node_tags[i], {coords[3 * i], coords[3 * i + 1], coords[3 * i + 2]}});
        }

        gmsh::vectorpair entities;
        gmsh::model::getEntities(entities);
        for (const auto& [dim, tag] : entities) {
            std::vector<int> types;
            std::vector<std::vector<std::size_t>> element_tags, element_nodes;
            gmsh::model::mesh::getElements(types, element_tags, element_nodes, dim, tag);
            for (std::size_t t = 0; t < types.size(); ++t) {
                std::string element_name;
                int element_dim = 0, order = 0, num_nodes = 0, num_primary = 0;
                std::vector<double> local;
                gmsh::model::mesh::getElementProperties(types[t], element_name, element_dim,
                                                        order, num_nodes, local, num_primary);
                for (std::size_t e = 0; e < element_tags[t].size(); ++e) {
                    MeshElement element;
                    element.tag = element_tags[t][e];
                    element.type = types[t];
                    element.entity_dim = dim;
                    element.entity_tag = tag;
                    auto first = element_nodes[t].begin() + static_cast<std::ptrdiff_t>(e * num_nodes);
                    element.nodes.assign(first, first + num_nodes);
                    mesh.elements.push_back(std::move(element));
                }
            }
        }
    });
    for (const auto& group : physical_groups()) {
        mesh.groups.push_back({group.dim, group.tag, group.name, group.entities});
    }
    return mesh;
}

void GmshKernel::update_nodes(const Mesh& mesh) {
    kernel_call("setNode", [&] {
        for (const auto& node : mesh.nodes) {
            gmsh::model::mesh::setNode(node.tag, {node.position.x, node.position.y, node.position.z}, {});
        }
    });
}

DimTags GmshKernel::import_shapes(const std::string& path) {
    gmsh::vectorpair out;
    kernel_call("importShapes " + path, [&] {
        if (settings_.occ_scaling != 1.0) {
            gmsh::option::setNumber("Geometry.OCCScaling", settings_.occ_scaling);
        }
        gmsh::model::occ::importShapes(path, out, false);
        gmsh::model::occ::synchronize();
    });
    return from_gmsh(out);
}

void GmshKernel::open(const std::string& path) {
    kernel_call("open " + path, [&] { gmsh::open(path); });
}

void GmshKernel::write(const std::string& path) {
    kernel_call("write " + path, [&] { gmsh::write(path); });
    logging::get_logger()->info("Wrote {}", path);
}

std::unique_ptr<Kernel> make_gmsh_kernel(const GmshSettings& settings) {
    return std::make_unique<GmshKernel>(settings);
}

}  // namespace magnetmesh
