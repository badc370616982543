#include "fake_kernel.hpp"

#include <common/errors.hpp>

#include <algorithm>
#include <cmath>
#include <set>

namespace magnetmesh {
namespace test {

namespace {

constexpr double EPS = 1e-9;
constexpr int DERIVED_BASE = 100000;
constexpr double POINT_QUANTUM = 1e7;

Vec3 to_cartesian(FakeFrame frame, double a, double b, double c) {
    if (frame == FakeFrame::Planar) {
        return {a, b, 0.0};
    }
    return rotate_about({a, b, 0.0}, Axis::Y, degrees_to_radians(c));
}

std::vector<double> extremes(double lo, double hi) {
    if (hi - lo > EPS) return {lo, hi};
    return {lo};
}

BoundingBox box_bounds(FakeFrame frame, const FakeBox& box) {
    BoundingBox result;
    std::vector<double> angles = extremes(box.lo[2], box.hi[2]);
    if (frame == FakeFrame::Cylindrical) {
        for (double a = std::ceil(box.lo[2] / 90.0) * 90.0; a < box.hi[2]; a += 90.0) {
            angles.push_back(a);
        }
    }
    for (double r : extremes(box.lo[0], box.hi[0])) {
        for (double y : extremes(box.lo[1], box.hi[1])) {
            for (double t : angles) {
                result.expand(to_cartesian(frame, r, y, t));
            }
        }
    }
    return result;
}

double box_measure(const FakeShape& shape, const FakeBox& box) {
    const double d0 = box.hi[0] - box.lo[0];
    const double d1 = box.hi[1] - box.lo[1];
    if (shape.frame == FakeFrame::Planar) {
        if (shape.dim == 2) return d0 * d1;
        if (shape.dim == 1) return std::hypot(d0, d1);
        return 0.0;
    }
    const double a = box.lo[0];
    const double b = box.hi[0];
    const double dt = degrees_to_radians(box.hi[2] - box.lo[2]);
    if (shape.dim == 3) return 0.5 * (b * b - a * a) * dt * d1;
    if (shape.dim == 2) {
        if (d0 <= EPS) return a * dt * d1;
        if (d1 <= EPS) return 0.5 * (b * b - a * a) * dt;
        return d0 * d1;
    }
    return 0.0;
}

Vec3 box_centroid(const FakeShape& shape, const FakeBox& box) {
    const double ymid = 0.5 * (box.lo[1] + box.hi[1]);
    if (shape.frame == FakeFrame::Planar) {
        return {0.5 * (box.lo[0] + box.hi[0]), ymid, 0.0};
    }
    const double a = box.lo[0];
    const double b = box.hi[0];
    double r = 0.5 * (a + b);
    if (shape.dim == 3 && b - a > EPS) {
        r = (2.0 / 3.0) * (b * b * b - a * a * a) / (b * b - a * a);
    }
    const double half = 0.5 * degrees_to_radians(box.hi[2] - box.lo[2]);
    if (half > EPS) {
        r *= std::sin(half) / half;
    }
    return rotate_about({r, ymid, 0.0}, Axis::Y,
                        degrees_to_radians(0.5 * (box.lo[2] + box.hi[2])));
}

// Cell grid spanned by the breakpoints of a set of shapes
struct Grid {
    std::array<std::vector<double>, 3> axis;
    int dims = 2;

    std::size_t count(int a) const {
        return axis[a].size() < 2 ? 0 : axis[a].size() - 1;
    }

    FakeBox cell(std::size_t i, std::size_t j, std::size_t k) const {
        return {{axis[0][i], axis[1][j], axis[2][k]},
                {axis[0][i + 1], axis[1][j + 1], axis[2][k + 1]}};
    }
};

Grid make_grid(const std::vector<const FakeShape*>& shapes, FakeFrame frame) {
    Grid g;
    g.dims = frame == FakeFrame::Planar ? 2 : 3;
    for (int a = 0; a < g.dims; ++a) {
        auto& v = g.axis[a];
        for (const auto* s : shapes) {
            for (const auto& b : s->boxes) {
                v.push_back(b.lo[a]);
                v.push_back(b.hi[a]);
            }
        }
        std::sort(v.begin(), v.end());
        v.erase(std::unique(v.begin(), v.end(),
                            [](double x, double y) { return std::abs(x - y) < EPS; }),
                v.end());
    }
    if (g.dims == 2) {
        g.axis[2] = {0.0, 0.0};
    }
    return g;
}

bool covers(const FakeShape& shape, const FakeBox& cell, int dims) {
    for (const auto& b : shape.boxes) {
        bool inside = true;
        for (int a = 0; a < dims; ++a) {
            double c = 0.5 * (cell.lo[a] + cell.hi[a]);
            if (c <= b.lo[a] || c >= b.hi[a]) {
                inside = false;
                break;
            }
        }
        if (inside) return true;
    }
    return false;
}

// Owner tag of every cell of the grid, 0 where no shape covers it
class OwnerMap {
public:
    OwnerMap(const Grid& grid, const std::vector<std::pair<int, const FakeShape*>>& shapes)
        : grid_(grid) {
        owners_.resize(grid.count(0) * grid.count(1) * grid.count(2), 0);
        for (std::size_t i = 0; i < grid.count(0); ++i) {
            for (std::size_t j = 0; j < grid.count(1); ++j) {
                for (std::size_t k = 0; k < grid.count(2); ++k) {
                    FakeBox c = grid.cell(i, j, k);
                    for (const auto& [tag, s] : shapes) {
                        if (covers(*s, c, grid.dims)) {
                            owners_[index(i, j, k)] = tag;
                            break;
                        }
                    }
                }
            }
        }
    }

    int at(std::size_t i, std::size_t j, std::size_t k) const {
        return owners_[index(i, j, k)];
    }

private:
    std::size_t index(std::size_t i, std::size_t j, std::size_t k) const {
        return (i * grid_.count(1) + j) * grid_.count(2) + k;
    }

    const Grid& grid_;
    std::vector<int> owners_;
};

}  // namespace

FakeKernel::FakeKernel(std::shared_ptr<FakeWorld> world) : world_(std::move(world)) {
    ++world_->kernels_created;
}

FakeKernel::~FakeKernel() {
    ++world_->kernels_released;
    world_->last_options = options_;
    world_->last_groups = groups_;
}

void FakeKernel::new_model(const std::string& name) {
    clear();
    model_name_ = name;
}

void FakeKernel::clear() {
    shapes_.clear();
    derived_.clear();
    counters_.clear();
    points_.clear();
    groups_.clear();
    group_counters_.clear();
    mesh_sizes_.clear();
    refinement_fields_ = 0;
    mesh_.reset();
}

void FakeKernel::check(const std::string& operation) const {
    if (world_->fail_on == operation) {
        throw KernelOperationError("injected " + operation + " failure", "");
    }
}

int FakeKernel::next_tag(int dim) {
    return ++counters_[dim];
}

int FakeKernel::add(const FakeShape& shape) {
    int tag = next_tag(shape.dim);
    shapes_[{shape.dim, tag}] = shape;
    return tag;
}

const FakeShape& FakeKernel::shape(const DimTag& entity) const {
    auto it = shapes_.find(entity);
    if (it != shapes_.end()) return it->second;
    it = derived_.find(entity);
    if (it != derived_.end()) return it->second;
    throw KernelOperationError("unknown entity (" + std::to_string(entity.dim) + ", " +
                               std::to_string(entity.tag) + ")", "");
}

int FakeKernel::add_rectangle(double x, double y, double dx, double dy) {
    if (dx <= 0.0 || dy <= 0.0) {
        throw KernelOperationError("degenerate rectangle", "");
    }
    return add(planar_rect(x, y, x + dx, y + dy));
}

int FakeKernel::add_polygon(const std::vector<Vec3>&) {
    throw KernelOperationError("polygons are not supported by the fake kernel", "");
}

int FakeKernel::add_segment(const Vec3& a, const Vec3& b) {
    if (std::abs(a.x - b.x) > EPS && std::abs(a.y - b.y) > EPS) {
        throw KernelOperationError("only axis aligned segments are supported", "");
    }
    return add(planar_segment(std::min(a.x, b.x), std::min(a.y, b.y), std::max(a.x, b.x),
                              std::max(a.y, b.y)));
}

int FakeKernel::add_annular_sector(double, double, double, double) {
    throw KernelOperationError("annular sectors are not supported by the fake kernel", "");
}

int FakeKernel::add_wedge(double r0, double r1, double y0, double y1, double angle) {
    return add(wedge(r0, r1, y0, y1, 0.0, angle));
}

DimTags FakeKernel::revolve(const DimTags& entities, Axis axis, double angle,
                            std::vector<DimTags>& ancestry) {
    check("revolve");
    if (axis != Axis::Y) {
        throw KernelOperationError("revolutions are about y only", "");
    }
    DimTags out;
    for (const auto& e : entities) {
        const FakeShape source = shape(e);
        if (source.dim != 2 || source.frame != FakeFrame::Planar) {
            throw KernelOperationError("only planar faces can be revolved", "");
        }
        FakeShape volume{3, FakeFrame::Cylindrical, {}};
        for (const auto& b : source.boxes) {
            if (b.lo[0] < -EPS) {
                throw KernelOperationError("face crosses the revolution axis", "");
            }
            volume.boxes.push_back({{b.lo[0], b.lo[1], 0.0}, {b.hi[0], b.hi[1], angle}});
        }
        shapes_.erase(e);
        int tag = add(volume);
        out.push_back({3, tag});
        ancestry.push_back({{3, tag}});
    }
    return out;
}

DimTags FakeKernel::copy(const DimTags& entities) {
    DimTags out;
    for (const auto& e : entities) {
        const FakeShape source = shape(e);
        out.push_back({e.dim, add(source)});
    }
    return out;
}

void FakeKernel::rotate(const DimTags& entities, Axis axis, double angle) {
    if (axis != Axis::Y) {
        throw KernelOperationError("rotations are about y only", "");
    }
    for (const auto& e : entities) {
        auto it = shapes_.find(e);
        if (it == shapes_.end() || it->second.frame != FakeFrame::Cylindrical) {
            throw KernelOperationError("only cylindrical entities can be rotated", "");
        }
        std::vector<FakeBox> boxes;
        for (auto b : it->second.boxes) {
            b.lo[2] += angle;
            b.hi[2] += angle;
            double turns = std::floor(b.lo[2] / 360.0);
            b.lo[2] -= 360.0 * turns;
            b.hi[2] -= 360.0 * turns;
            if (b.hi[2] > 360.0 + EPS) {
                FakeBox wrapped = b;
                wrapped.lo[2] = 0.0;
                wrapped.hi[2] = b.hi[2] - 360.0;
                b.hi[2] = 360.0;
                boxes.push_back(wrapped);
            }
            boxes.push_back(b);
        }
        it->second.boxes = boxes;
    }
}

void FakeKernel::remove(const DimTags& entities, bool) {
    for (const auto& e : entities) {
        shapes_.erase(e);
    }
}

BooleanResult FakeKernel::boolean(BooleanOp op, const DimTags& objects, const DimTags& tools,
                                  bool remove_tool) {
    check("boolean");
    DimTags inputs = objects;
    inputs.insert(inputs.end(), tools.begin(), tools.end());

    int top = 0;
    for (const auto& t : inputs) {
        top = std::max(top, shape(t).dim);
    }
    BooleanResult result;
    result.ancestry.resize(inputs.size());

    std::vector<std::size_t> solids;
    std::vector<const FakeShape*> solid_shapes;
    FakeFrame frame = FakeFrame::Planar;
    for (std::size_t i = 0; i < inputs.size(); ++i) {
        const FakeShape& s = shape(inputs[i]);
        if (s.dim != top) {
            // Lower dimensional inputs go through unchanged
            result.out.push_back(inputs[i]);
            result.ancestry[i] = {inputs[i]};
            continue;
        }
        if (!solids.empty() && s.frame != frame) {
            throw KernelOperationError("boolean between planar and cylindrical entities", "");
        }
        frame = s.frame;
        solids.push_back(i);
        solid_shapes.push_back(&s);
    }

    const Grid grid = make_grid(solid_shapes, frame);
    struct Cell {
        FakeBox box;
        std::vector<std::size_t> covering;
    };
    std::vector<Cell> cells;
    for (std::size_t i = 0; i < grid.count(0); ++i) {
        for (std::size_t j = 0; j < grid.count(1); ++j) {
            for (std::size_t k = 0; k < grid.count(2); ++k) {
                Cell c{grid.cell(i, j, k), {}};
                for (std::size_t n = 0; n < solids.size(); ++n) {
                    if (covers(*solid_shapes[n], c.box, grid.dims)) {
                        c.covering.push_back(solids[n]);
                    }
                }
                if (!c.covering.empty()) {
                    cells.push_back(std::move(c));
                }
            }
        }
    }

    std::vector<std::pair<FakeShape, std::vector<std::size_t>>> made;
    auto emit = [&](std::vector<FakeBox> boxes, std::vector<std::size_t> from) {
        if (!boxes.empty()) {
            made.push_back({FakeShape{top, frame, std::move(boxes)}, std::move(from)});
        }
    };
    auto is_object = [&](std::size_t i) { return i < objects.size(); };
    bool tools_consumed = true;

    switch (op) {
        case BooleanOp::Fragment: {
            std::map<std::vector<std::size_t>, std::vector<FakeBox>> pieces;
            for (const auto& c : cells) {
                pieces[c.covering].push_back(c.box);
            }
            for (auto& [signature, boxes] : pieces) {
                emit(boxes, signature);
            }
            break;
        }
        case BooleanOp::Fuse: {
            std::vector<FakeBox> boxes;
            for (const auto& c : cells) {
                boxes.push_back(c.box);
            }
            emit(boxes, solids);
            break;
        }
        case BooleanOp::Cut:
        case BooleanOp::Intersect: {
            for (std::size_t i : solids) {
                if (!is_object(i)) continue;
                std::vector<FakeBox> boxes;
                for (const auto& c : cells) {
                    bool in_object = std::count(c.covering.begin(), c.covering.end(), i) > 0;
                    bool in_tool = std::any_of(c.covering.begin(), c.covering.end(),
                                               [&](std::size_t n) { return !is_object(n); });
                    bool keep = op == BooleanOp::Cut ? !in_tool : in_tool;
                    if (in_object && keep) {
                        boxes.push_back(c.box);
                    }
                }
                emit(boxes, {i});
            }
            tools_consumed = remove_tool;
            break;
        }
    }

    for (std::size_t i : solids) {
        if (is_object(i) || tools_consumed) {
            shapes_.erase(inputs[i]);
        } else {
            result.out.push_back(inputs[i]);
            result.ancestry[i] = {inputs[i]};
        }
    }
    for (auto& [s, from] : made) {
        int tag = add(s);
        result.out.push_back({top, tag});
        for (std::size_t i : from) {
            result.ancestry[i].push_back({top, tag});
        }
    }
    return result;
}

void FakeKernel::synchronize() {
    derived_.clear();
    derive_edges();
    derive_faces();
}

void FakeKernel::derive_edges() {
    std::vector<std::pair<int, const FakeShape*>> faces;
    std::vector<const FakeShape*> shapes;
    for (const auto& [tag, s] : shapes_) {
        if (tag.dim == 2 && s.frame == FakeFrame::Planar) {
            faces.push_back({tag.tag, &s});
            shapes.push_back(&s);
        }
    }
    if (faces.empty()) return;

    const Grid grid = make_grid(shapes, FakeFrame::Planar);
    const OwnerMap owners(grid, faces);
    const std::size_t nx = grid.count(0);
    const std::size_t ny = grid.count(1);
    int next = DERIVED_BASE;
    auto emit = [&](double x0, double y0, double x1, double y1) {
        derived_[{1, ++next}] = planar_segment(x0, y0, x1, y1);
    };

    for (std::size_t i = 0; i <= nx; ++i) {
        for (std::size_t j = 0; j < ny; ++j) {
            int left = i > 0 ? owners.at(i - 1, j, 0) : 0;
            int right = i < nx ? owners.at(i, j, 0) : 0;
            if (left != right) {
                double x = grid.axis[0][i];
                emit(x, grid.axis[1][j], x, grid.axis[1][j + 1]);
            }
        }
    }
    for (std::size_t j = 0; j <= ny; ++j) {
        for (std::size_t i = 0; i < nx; ++i) {
            int below = j > 0 ? owners.at(i, j - 1, 0) : 0;
            int above = j < ny ? owners.at(i, j, 0) : 0;
            if (below != above) {
                double y = grid.axis[1][j];
                emit(grid.axis[0][i], y, grid.axis[0][i + 1], y);
            }
        }
    }
}

void FakeKernel::derive_faces() {
    std::vector<std::pair<int, const FakeShape*>> volumes;
    std::vector<const FakeShape*> shapes;
    for (const auto& [tag, s] : shapes_) {
        if (tag.dim == 3 && s.frame == FakeFrame::Cylindrical) {
            volumes.push_back({tag.tag, &s});
            shapes.push_back(&s);
        }
    }
    if (volumes.empty()) return;

    const Grid grid = make_grid(shapes, FakeFrame::Cylindrical);
    const OwnerMap owners(grid, volumes);
    const auto& rs = grid.axis[0];
    const auto& ys = grid.axis[1];
    const auto& ts = grid.axis[2];
    const std::size_t nr = grid.count(0);
    const std::size_t ny = grid.count(1);
    const std::size_t nt = grid.count(2);
    const bool periodic = nt > 0 && std::abs(ts.front()) < EPS && std::abs(ts.back() - 360.0) < EPS;
    int next = DERIVED_BASE;
    auto emit = [&](const FakeBox& box) {
        derived_[{2, ++next}] = FakeShape{2, FakeFrame::Cylindrical, {box}};
    };

    // Cylinders r = const, skipping the axis
    for (std::size_t i = 0; i <= nr; ++i) {
        if (rs[i] <= EPS) continue;
        for (std::size_t j = 0; j < ny; ++j) {
            for (std::size_t k = 0; k < nt; ++k) {
                int inner = i > 0 ? owners.at(i - 1, j, k) : 0;
                int outer = i < nr ? owners.at(i, j, k) : 0;
                if (inner != outer) {
                    emit({{rs[i], ys[j], ts[k]}, {rs[i], ys[j + 1], ts[k + 1]}});
                }
            }
        }
    }
    // Annuli y = const
    for (std::size_t j = 0; j <= ny; ++j) {
        for (std::size_t i = 0; i < nr; ++i) {
            for (std::size_t k = 0; k < nt; ++k) {
                int below = j > 0 ? owners.at(i, j - 1, k) : 0;
                int above = j < ny ? owners.at(i, j, k) : 0;
                if (below != above) {
                    emit({{rs[i], ys[j], ts[k]}, {rs[i + 1], ys[j], ts[k + 1]}});
                }
            }
        }
    }
    // Half planes theta = const; a full turn wraps around
    for (std::size_t k = 0; k <= nt; ++k) {
        if (periodic && k == nt) continue;
        for (std::size_t i = 0; i < nr; ++i) {
            for (std::size_t j = 0; j < ny; ++j) {
                int before = k > 0 ? owners.at(i, j, k - 1)
                                   : (periodic ? owners.at(i, j, nt - 1) : 0);
                int after = k < nt ? owners.at(i, j, k) : 0;
                if (before != after) {
                    emit({{rs[i], ys[j], ts[k]}, {rs[i + 1], ys[j + 1], ts[k]}});
                }
            }
        }
    }
}

int FakeKernel::point_tag(const Vec3& p) const {
    std::array<long long, 3> key{std::llround(p.x * POINT_QUANTUM),
                                 std::llround(p.y * POINT_QUANTUM),
                                 std::llround(p.z * POINT_QUANTUM)};
    auto it = points_.find(key);
    if (it != points_.end()) return it->second;
    int tag = static_cast<int>(points_.size()) + 1;
    points_[key] = tag;
    return tag;
}

DimTags FakeKernel::entities(int dim) const {
    DimTags result;
    if (dim == 0) {
        for (const auto& [key, tag] : points_) {
            result.push_back({0, tag});
        }
        std::sort(result.begin(), result.end());
        return result;
    }
    for (const auto& [tag, s] : shapes_) {
        if (tag.dim == dim) result.push_back(tag);
    }
    for (const auto& [tag, s] : derived_) {
        if (tag.dim == dim) result.push_back(tag);
    }
    return result;
}

DimTags FakeKernel::entities_in_box(const BoundingBox& box, int dim) const {
    DimTags result;
    for (const auto& e : entities(dim)) {
        if (box.contains(bounding_box(e))) {
            result.push_back(e);
        }
    }
    return result;
}

DimTags FakeKernel::boundary_points(const DimTags& entities) const {
    std::set<DimTag> points;
    for (const auto& e : entities) {
        if (e.dim == 0) continue;
        const FakeShape& s = shape(e);
        for (const auto& b : s.boxes) {
            for (double a : extremes(b.lo[0], b.hi[0])) {
                for (double y : extremes(b.lo[1], b.hi[1])) {
                    for (double t : extremes(b.lo[2], b.hi[2])) {
                        points.insert({0, point_tag(to_cartesian(s.frame, a, y, t))});
                    }
                }
            }
        }
    }
    return DimTags(points.begin(), points.end());
}

BoundingBox FakeKernel::bounding_box(const DimTag& entity) const {
    BoundingBox result;
    if (entity.dim == 0) {
        for (const auto& [key, tag] : points_) {
            if (tag == entity.tag) {
                result.expand({key[0] / POINT_QUANTUM, key[1] / POINT_QUANTUM,
                               key[2] / POINT_QUANTUM});
            }
        }
        return result;
    }
    const FakeShape& s = shape(entity);
    for (const auto& b : s.boxes) {
        result.merge(box_bounds(s.frame, b));
    }
    return result;
}

Vec3 FakeKernel::center_of_mass(const DimTag& entity) const {
    if (entity.dim == 0) {
        return bounding_box(entity).center();
    }
    const FakeShape& s = shape(entity);
    Vec3 sum;
    double total = 0.0;
    for (const auto& b : s.boxes) {
        double m = box_measure(s, b);
        sum += box_centroid(s, b) * m;
        total += m;
    }
    if (total <= 0.0) {
        return bounding_box(entity).center();
    }
    return sum / total;
}

double FakeKernel::mass(const DimTag& entity) const {
    if (entity.dim == 0) return 0.0;
    const FakeShape& s = shape(entity);
    double total = 0.0;
    for (const auto& b : s.boxes) {
        total += box_measure(s, b);
    }
    return total;
}

int FakeKernel::add_physical_group(int dim, const std::vector<int>& tags,
                                   const std::string& name) {
    int tag = ++group_counters_[dim];
    groups_.push_back({dim, tag, name, tags});
    return tag;
}

std::vector<KernelGroup> FakeKernel::physical_groups() const {
    return groups_;
}

void FakeKernel::remove_physical_groups() {
    groups_.clear();
    group_counters_.clear();
}

void FakeKernel::set_option(const std::string& name, double value) {
    options_[name] = value;
}

void FakeKernel::set_mesh_size(const DimTags& points, double size) {
    for (const auto& p : points) {
        mesh_sizes_[p] = size;
    }
}

void FakeKernel::add_refinement_field(const Vec3&, double, double, double, double) {
    ++refinement_fields_;
}

void FakeKernel::generate_mesh(int dim) {
    check("mesh");
    ++world_->meshes_generated;
    Mesh mesh;
    mesh.name = model_name_;
    std::size_t node = 0;
    std::size_t element = 0;

    for (int d = 1; d <= dim; ++d) {
        for (const auto& e : entities(d)) {
            const FakeShape& s = shape(e);
            for (const auto& b : s.boxes) {
                // Cylindrical cells are split in quarter turns at most
                std::vector<FakeBox> chunks;
                if (s.frame == FakeFrame::Cylindrical && b.hi[2] - b.lo[2] > 90.0 + EPS) {
                    for (double t = b.lo[2]; t < b.hi[2] - EPS; t += 90.0) {
                        FakeBox c = b;
                        c.lo[2] = t;
                        c.hi[2] = std::min(t + 90.0, b.hi[2]);
                        chunks.push_back(c);
                    }
                } else {
                    chunks.push_back(b);
                }
                for (const auto& c : chunks) {
                    MeshElement el;
                    el.entity_dim = d;
                    el.entity_tag = e.tag;
                    for (double a : extremes(c.lo[0], c.hi[0])) {
                        for (double y : extremes(c.lo[1], c.hi[1])) {
                            for (double t : extremes(c.lo[2], c.hi[2])) {
                                mesh.nodes.push_back({++node, to_cartesian(s.frame, a, y, t)});
                                el.nodes.push_back(node);
                            }
                        }
                    }
                    switch (el.nodes.size()) {
                        case 2: el.type = 1; break;
                        case 4: el.type = 3; break;
                        case 8: el.type = 5; break;
                        default: continue;
                    }
                    el.tag = ++element;
                    mesh.elements.push_back(std::move(el));
                }
            }
        }
    }
    for (const auto& g : groups_) {
        mesh.groups.push_back({g.dim, g.tag, g.name, g.entities});
    }
    mesh_ = std::move(mesh);
}

bool FakeKernel::has_mesh() const {
    return mesh_.has_value();
}

Mesh FakeKernel::read_mesh() const {
    if (!mesh_) {
        throw KernelOperationError("model has no mesh", model_name_);
    }
    return *mesh_;
}

void FakeKernel::update_nodes(const Mesh& mesh) {
    if (!mesh_) {
        throw KernelOperationError("model has no mesh", model_name_);
    }
    std::map<std::size_t, Vec3> positions;
    for (const auto& n : mesh.nodes) {
        positions[n.tag] = n.position;
    }
    for (auto& n : mesh_->nodes) {
        auto it = positions.find(n.tag);
        if (it != positions.end()) {
            n.position = it->second;
        }
    }
    mesh_->name = mesh.name;
}

DimTags FakeKernel::import_shapes(const std::string& path) {
    check("import");
    auto it = world_->shapes.find(path);
    if (it == world_->shapes.end()) {
        throw KernelOperationError("cannot import shapes", path);
    }
    DimTags out;
    for (const auto& s : it->second) {
        out.push_back({s.dim, add(s)});
    }
    return out;
}

void FakeKernel::open(const std::string& path) {
    check("open");
    auto it = world_->meshes.find(path);
    if (it == world_->meshes.end()) {
        throw KernelOperationError("cannot open file", path);
    }
    clear();
    mesh_ = it->second;
}

void FakeKernel::write(const std::string& path) {
    check("write");
    if (!mesh_) {
        throw KernelOperationError("nothing to write", path);
    }
    world_->meshes[path] = *mesh_;
}

KernelFactory fake_factory(const std::shared_ptr<FakeWorld>& world) {
    return [world]() -> std::unique_ptr<Kernel> { return std::make_unique<FakeKernel>(world); };
}

}  // namespace test
}  // namespace magnetmesh
