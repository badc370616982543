#include "sector_builder.hpp"

#include <common/errors.hpp>
#include <common/logging.hpp>

#include <cmath>
#include <map>
#include <numbers>

namespace magnetmesh {

namespace {

struct Hole {
    std::string family;   // "TieRod" or "Slit<j>"
    Category category = Category::Boundary;
    DimTag surface;
    BoundingBox box;
};

std::vector<Vec3> place_outline(const Outline& shape, double x) {
    std::vector<Vec3> points;
    points.reserve(shape.size());
    for (const auto& p : shape) {
        points.push_back({x + p[0], p[1], 0.0});
    }
    return points;
}

double polar_angle(const Vec3& p) {
    return std::atan2(p.y, p.x) * 180.0 / std::numbers::pi;
}

double polar_radius(const Vec3& p) {
    return std::hypot(p.x, p.y);
}

}  // namespace

void build_sector(BuildContext& ctx, const Bitter& bitter, const std::vector<std::string>& prefix) {
    if (!bitter.tierod) {
        throw ValidationError(bitter.name + ": a planar sector needs tie rods");
    }
    const TieRod& tierod = *bitter.tierod;
    if (tierod.n < 2) {
        throw ValidationError(bitter.name + ": a planar sector needs at least two tie rods");
    }
    if (tierod.shape.size() < 3) {
        throw ValidationError(bitter.name + ": tie rod without an outline");
    }
    for (const auto& slit : bitter.cooling_slits) {
        if (slit.shape.size() < 3) {
            throw ValidationError(bitter.name + ": cooling slit without an outline");
        }
    }

    auto log = logging::get_logger();
    const auto path = child_path(prefix, bitter.name);
    ctx.session.guarded(join_path(path), [&](Kernel& k) {
        const double theta = 360.0 / tierod.n;
        const auto& plate = ctx.add_solid(
            child_path(path, "B"), Category::Conductor,
            k.add_annular_sector(bitter.r[0], bitter.r[1], -theta / 2.0, theta / 2.0), true);

        std::vector<Hole> holes;
        holes.push_back({"TieRod", Category::Boundary,
                         {2, k.add_polygon(place_outline(tierod.shape, tierod.r))}, {}});

        for (std::size_t j = 0; j < bitter.cooling_slits.size(); ++j) {
            const CoolingSlit& slit = bitter.cooling_slits[j];
            const bool on_tierods = std::abs(slit.r - tierod.r) <= ctx.eps;
            int count = slit.n + (on_tierods ? tierod.n : 0);
            if (count <= 0) continue;

            const std::string family = "Slit" + std::to_string(j);
            const double step = 360.0 / count;
            DimTag base{2, k.add_polygon(place_outline(slit.shape, slit.r))};
            if (slit.angle != 0.0) {
                k.rotate({base}, Axis::Z, slit.angle);
            }
            // The slit at the tie rod position is the tie rod hole itself
            const bool keep_base = !(on_tierods && slit.angle == 0.0);
            if (keep_base) {
                holes.push_back({family, Category::Channel, base, {}});
            }
            for (int n = 1; n < count; ++n) {
                double position = n * step + slit.angle;
                if (position <= theta / 2.0 || position >= 360.0 - theta / 2.0) {
                    DimTags copies = k.copy({base});
                    k.rotate(copies, Axis::Z, n * step);
                    for (const auto& c : copies) {
                        holes.push_back({family, Category::Channel, c, {}});
                    }
                }
            }
            if (!keep_base) {
                k.remove({base}, true);
                ctx.lineage.discard({base});
            }
        }

        k.synchronize();
        DimTags tools;
        for (auto& hole : holes) {
            hole.box = k.bounding_box(hole.surface);
            tools.push_back(hole.surface);
        }
        ctx.lineage.discard(tools);
        run_boolean(ctx, BooleanOp::Cut, ctx.lineage.resolve(plate.id), tools, true);

        // Classify the curves of the holed plate by their end points
        const double angle_tol = ctx.eps / bitter.r[0] * 180.0 / std::numbers::pi;
        std::vector<std::pair<std::string, Category>> order{
            {"Rint", Category::Boundary}, {"Rext", Category::Boundary},
            {"Sym0", Category::Boundary}, {"Sym1", Category::Boundary}};
        for (const auto& hole : holes) {
            bool listed = false;
            for (const auto& [name, category] : order) {
                listed = listed || name == hole.family;
            }
            if (!listed) order.push_back({hole.family, hole.category});
        }

        std::map<std::string, DimTags> found;
        for (const auto& curve : k.entities(1)) {
            std::vector<Vec3> ends;
            for (const auto& p : k.boundary_points({curve})) {
                ends.push_back(k.bounding_box(p).min);
            }
            auto all_ends = [&](auto&& predicate) {
                if (ends.size() != 2) return false;
                return predicate(ends[0]) && predicate(ends[1]);
            };
            std::string family;
            if (all_ends([&](const Vec3& p) { return std::abs(polar_radius(p) - bitter.r[0]) <= ctx.eps; })) {
                family = "Rint";
            } else if (all_ends([&](const Vec3& p) { return std::abs(polar_radius(p) - bitter.r[1]) <= ctx.eps; })) {
                family = "Rext";
            } else if (all_ends([&](const Vec3& p) { return std::abs(polar_angle(p) + theta / 2.0) <= angle_tol; })) {
                family = "Sym0";
            } else if (all_ends([&](const Vec3& p) { return std::abs(polar_angle(p) - theta / 2.0) <= angle_tol; })) {
                family = "Sym1";
            } else {
                BoundingBox box = k.bounding_box(curve);
                for (const auto& hole : holes) {
                    if (hole.box.inflated(ctx.eps).contains(box)) {
                        family = hole.family;
                        break;
                    }
                }
            }
            if (family.empty()) {
                ctx.warnings.push_back("curve " + std::to_string(curve.tag) + " of '" +
                                       join_path(path) + "' matches no boundary");
                continue;
            }
            found[family].push_back(curve);
        }

        for (const auto& [family, category] : order) {
            auto it = found.find(family);
            if (it == found.end()) {
                ctx.warnings.push_back("boundary '" + join_path(child_path(path, family)) +
                                       "' is empty");
                continue;
            }
            const auto& name = ctx.registry.register_name(child_path(path, family), category, 1);
            ctx.lineage.bind(name, it->second);
        }
        log->debug("Sector of '{}': {} degrees, {} holes", join_path(path), theta, holes.size());
    });
}

}  // namespace magnetmesh
