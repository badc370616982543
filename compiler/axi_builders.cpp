#include "axi_builders.hpp"

#include <common/errors.hpp>
#include <common/logging.hpp>

#include <algorithm>
#include <type_traits>

namespace magnetmesh {

namespace {

struct BoundaryNames {
    const char* bottom;
    const char* top;
    const char* inner;
    const char* outer;
};

constexpr BoundaryNames PLATE_BOUNDARIES{"HP", "BP", "Rint", "Rext"};
constexpr BoundaryNames HELIX_BOUNDARIES{"HP", "BP", "rInt", "rExt"};

void add_box_boundaries(BuildContext& ctx, const std::vector<std::string>& path,
                        double r0, double r1, double z0, double z1, const BoundaryNames& names) {
    ctx.boundaries.push_back({child_path(path, names.bottom), Category::Boundary,
                              {{r0, z0, r1, z0}}, false});
    ctx.boundaries.push_back({child_path(path, names.top), Category::Boundary,
                              {{r0, z1, r1, z1}}, false});
    ctx.boundaries.push_back({child_path(path, names.inner), Category::Boundary,
                              {{r0, z0, r0, z1}}, false});
    ctx.boundaries.push_back({child_path(path, names.outer), Category::Boundary,
                              {{r1, z0, r1, z1}}, false});
}

DimTags resolve_all(const BuildContext& ctx, const std::vector<NameId>& ids) {
    DimTags tags;
    for (NameId id : ids) {
        DimTags t = ctx.lineage.resolve(id);
        tags.insert(tags.end(), t.begin(), t.end());
    }
    return tags;
}

// Triangle removed from an end block, in the profile plane
std::vector<Vec3> chamfer_triangle(const Helix& helix, const Chamfer& chamfer) {
    const bool inner = chamfer.radial_side == RadialSide::Inner;
    const bool bottom = chamfer.side == EndSide::HP;
    double r = inner ? helix.r[0] : helix.r[1];
    double dr = inner ? chamfer.radial_extent() : -chamfer.radial_extent();
    double z = bottom ? helix.z[0] : helix.z[1];
    double dz = bottom ? chamfer.length : -chamfer.length;
    return {{r, z, 0.0}, {r + dr, z, 0.0}, {r, z + dz, 0.0}};
}

void cut_chamfers(BuildContext& ctx, const Helix& helix, NameId block, EndSide side) {
    for (const auto& chamfer : helix.chamfers) {
        if (chamfer.side != side) continue;
        int tool = ctx.kernel().add_polygon(chamfer_triangle(helix, chamfer));
        ctx.lineage.discard({{2, tool}});
        run_boolean(ctx, BooleanOp::Cut, ctx.lineage.resolve(block), {{2, tool}}, true);
    }
}

// Radial gap between two helices, or between a helix and a bore
struct ChannelGap {
    double r0 = 0.0;
    double r1 = 0.0;
    const Helix* inner = nullptr;
    const Helix* outer = nullptr;
};

std::vector<ChannelGap> channel_gaps(const Insert& insert) {
    std::vector<ChannelGap> gaps;
    const auto& helices = insert.helices;
    if (helices.empty()) return gaps;
    if (insert.innerbore > 0.0 && insert.innerbore < helices.front().r[0]) {
        gaps.push_back({insert.innerbore, helices.front().r[0], nullptr, &helices.front()});
    }
    for (std::size_t i = 1; i < helices.size(); ++i) {
        gaps.push_back({helices[i - 1].r[1], helices[i].r[0], &helices[i - 1], &helices[i]});
    }
    if (insert.outerbore > helices.back().r[1]) {
        gaps.push_back({helices.back().r[1], insert.outerbore, &helices.back(), nullptr});
    }
    return gaps;
}

}  // namespace

void build_bitter(BuildContext& ctx, const Bitter& bitter, const std::vector<std::string>& prefix) {
    const auto path = child_path(prefix, bitter.name);
    ctx.session.guarded(join_path(path), [&](Kernel& k) {
        const double r0 = bitter.r[0];
        const double w = bitter.r[1] - bitter.r[0];
        const double h = bitter.axial.h;
        const auto section = child_path(path, "B");

        DimTags sections;
        auto add_section = [&](double y0, double y1) {
            const auto& name = ctx.add_solid(section, Category::Conductor,
                                             k.add_rectangle(r0, y0, w, y1 - y0), true);
            DimTags t = ctx.lineage.resolve(name.id);
            sections.insert(sections.end(), t.begin(), t.end());
        };

        if (-h - bitter.z[0] > ctx.eps) add_section(bitter.z[0], -h);
        double y = -h;
        for (std::size_t i = 0; i < bitter.axial.turns.size(); ++i) {
            double next = y + bitter.axial.section_height(i);
            add_section(y, next);
            y = next;
        }
        if (bitter.z[1] - h > ctx.eps) add_section(h, bitter.z[1]);

        // Cooling slits are lines splitting the sections at their radius
        DimTags slits;
        for (const auto& slit : bitter.cooling_slits) {
            ProfileSegment segment{slit.r, bitter.z[0], slit.r, bitter.z[1]};
            int line = k.add_segment({slit.r, bitter.z[0], 0.0}, {slit.r, bitter.z[1], 0.0});
            const auto& name = ctx.registry.register_indexed(child_path(path, "slit"),
                                                             Category::Channel, 1);
            ctx.lineage.bind(name, {{1, line}});
            ctx.curves.push_back({name.id, segment});
            slits.push_back({1, line});
        }
        if (!slits.empty()) {
            run_boolean(ctx, BooleanOp::Fragment, sections, slits, true);
        }

        add_box_boundaries(ctx, path, bitter.r[0], bitter.r[1], bitter.z[0], bitter.z[1],
                           PLATE_BOUNDARIES);
        logging::get_logger()->debug("Bitter '{}': {} sections, {} slits", join_path(path),
                                     sections.size(), slits.size());
    });
}

void build_helix(BuildContext& ctx, const Helix& helix, const std::vector<std::string>& prefix) {
    const auto path = child_path(prefix, helix.name);
    ctx.session.guarded(join_path(path), [&](Kernel& k) {
        const double r0 = helix.r[0];
        const double w = helix.r[1] - helix.r[0];
        const double h = helix.axial.h;
        const auto section = child_path(path, "Cu");

        if (-h - helix.z[0] > ctx.eps) {
            const auto& block = ctx.add_solid(section, Category::Conductor,
                                              k.add_rectangle(r0, helix.z[0], w, -h - helix.z[0]),
                                              true);
            cut_chamfers(ctx, helix, block.id, EndSide::HP);
        }
        double y = -h;
        for (std::size_t i = 0; i < helix.axial.turns.size(); ++i) {
            double height = helix.axial.section_height(i);
            ctx.add_solid(section, Category::Conductor, k.add_rectangle(r0, y, w, height), true);
            y += height;
        }
        if (helix.z[1] - h > ctx.eps) {
            const auto& block = ctx.add_solid(section, Category::Conductor,
                                              k.add_rectangle(r0, h, w, helix.z[1] - h), true);
            cut_chamfers(ctx, helix, block.id, EndSide::BP);
        }

        add_box_boundaries(ctx, path, helix.r[0], helix.r[1], helix.z[0], helix.z[1],
                           HELIX_BOUNDARIES);
    });
}

void build_ring(BuildContext& ctx, const Insert& insert, std::size_t index,
                const std::vector<std::string>& prefix) {
    const Ring& ring = insert.rings.at(index);
    const auto path = child_path(prefix, ring.name);
    ctx.session.guarded(join_path(path), [&](Kernel& k) {
        auto [za, zb] = ring_axial_range(insert, index);
        ctx.add_solid(path, Category::Conductor,
                      k.add_rectangle(ring.r[0], za, ring.r[3] - ring.r[0], zb - za));

        ctx.boundaries.push_back({child_path(path, "R0n"), Category::Boundary,
                                  {{ring.r[0], za, ring.r[0], zb}}, false});
        ctx.boundaries.push_back({child_path(path, "R1n"), Category::Boundary,
                                  {{ring.r[3], za, ring.r[3], zb}}, false});
        // Only the face away from the helices is exposed
        if (index % 2 == 0) {
            ctx.boundaries.push_back({child_path(path, "BP"), Category::Boundary,
                                      {{ring.r[0], zb, ring.r[3], zb}}, false});
        } else {
            ctx.boundaries.push_back({child_path(path, "HP"), Category::Boundary,
                                      {{ring.r[0], za, ring.r[3], za}}, false});
        }
    });
}

void build_insert(BuildContext& ctx, const Insert& insert, const std::vector<std::string>& prefix) {
    auto log = logging::get_logger();
    const auto path = child_path(prefix, insert.name);
    const std::size_t first_solid = ctx.solids.size();

    for (const auto& helix : insert.helices) {
        build_helix(ctx, helix, path);
    }
    for (std::size_t i = 0; i < insert.rings.size(); ++i) {
        build_ring(ctx, insert, i, path);
    }
    const std::vector<NameId> members(ctx.solids.begin() + first_solid, ctx.solids.end());

    double z_min = insert.helices.front().z[0];
    double z_max = insert.helices.front().z[1];
    for (const auto& helix : insert.helices) {
        z_min = std::min(z_min, helix.z[0]);
        z_max = std::max(z_max, helix.z[1]);
    }

    const auto gaps = channel_gaps(insert);
    ctx.session.guarded(join_path(path), [&](Kernel& k) {
        for (std::size_t i = 0; i < gaps.size(); ++i) {
            const ChannelGap& gap = gaps[i];
            const auto channel = child_path(path, "Channel" + std::to_string(i));
            if (ctx.options.thick_channels) {
                const auto& name = ctx.add_solid(
                    channel, Category::Channel,
                    k.add_rectangle(gap.r0, z_min, gap.r1 - gap.r0, z_max - z_min));
                run_boolean(ctx, BooleanOp::Cut, ctx.lineage.resolve(name.id),
                            resolve_all(ctx, members), false);
                continue;
            }
            BoundarySpec spec{channel, Category::Channel, {}, false};
            if (gap.inner) {
                spec.segments.push_back({gap.r0, gap.inner->z[0], gap.r0, gap.inner->z[1]});
            }
            if (gap.outer) {
                spec.segments.push_back({gap.r1, gap.outer->z[0], gap.r1, gap.outer->z[1]});
            }
            ctx.boundaries.push_back(std::move(spec));
        }
    });
    log->debug("Insert '{}': {} helices, {} rings, {} channels", join_path(path),
               insert.helices.size(), insert.rings.size(), gaps.size());
}

namespace {

// One pancake of height dz at y: a single solid, or at tape level a mandrel
// then superconductor and duromag bands for every tape
void build_pancake(BuildContext& ctx, Kernel& k, const Supra& supra,
                   const std::vector<std::string>& path, double y, double dz) {
    double x = supra.r[0];
    if (supra.detail != SupraDetail::Tape) {
        ctx.add_solid(path, Category::Conductor, k.add_rectangle(x, y, supra.r[1] - x, dz));
        return;
    }
    if (supra.mandrel > ctx.eps) {
        ctx.add_solid(child_path(path, "Mandrel"), Category::Structure,
                      k.add_rectangle(x, y, supra.mandrel, dz));
        x += supra.mandrel;
    }
    const double tape = supra.tape_width();
    const double sc = supra.duromag > ctx.eps ? tape - supra.duromag : tape;
    for (int t = 0; t < supra.tapes; ++t) {
        ctx.add_solid(child_path(path, "SC"), Category::Conductor,
                      k.add_rectangle(x, y, sc, dz), true);
        if (supra.duromag > ctx.eps) {
            ctx.add_solid(child_path(path, "Du"), Category::Structure,
                          k.add_rectangle(x + sc, y, supra.duromag, dz), true);
        }
        x += tape;
    }
}

}  // namespace

void build_supra(BuildContext& ctx, const Supra& supra, const std::vector<std::string>& prefix) {
    const auto path = child_path(prefix, supra.name);
    ctx.session.guarded(join_path(path), [&](Kernel& k) {
        const double r0 = supra.r[0];
        const double w = supra.r[1] - supra.r[0];
        const double height = supra.z[1] - supra.z[0];

        std::vector<NameId> isolants;
        if (supra.pancakes == 0 || supra.detail == SupraDetail::None) {
            ctx.add_solid(path, Category::Conductor, k.add_rectangle(r0, supra.z[0], w, height));
        } else {
            const int n = supra.pancakes;
            const double dblpancake = supra.dblpancake_height();
            double y = supra.z[0];
            for (int i = 0; i < n; ++i) {
                if (supra.detail == SupraDetail::DblPancake) {
                    ctx.add_solid(child_path(path, "P"), Category::Conductor,
                                  k.add_rectangle(r0, y, w, dblpancake), true);
                } else {
                    const auto dp = child_path(path, "P" + std::to_string(i));
                    const double pancake = supra.pancake_height();
                    build_pancake(ctx, k, supra, child_path(dp, "p0"), y, pancake);
                    ctx.add_solid(child_path(dp, "I"), Category::Isolant,
                                  k.add_rectangle(r0, y + pancake, w, supra.pancake_isolant));
                    build_pancake(ctx, k, supra, child_path(dp, "p1"),
                                  y + pancake + supra.pancake_isolant, pancake);
                }
                y += dblpancake;
                if (i + 1 < n) {
                    const auto& layer = ctx.add_solid(child_path(path, "I"), Category::Isolant,
                                                      k.add_rectangle(r0, y, w, supra.isolant),
                                                      true);
                    isolants.push_back(layer.id);
                    y += supra.isolant;
                }
            }
        }

        const double ins = supra.insulation;
        if (ins > ctx.eps) {
            int outer = k.add_rectangle(r0 - ins, supra.z[0] - ins, w + 2.0 * ins, height + 2.0 * ins);
            const auto& frame = ctx.add_solid(child_path(path, "Insulation"), Category::Isolant,
                                              outer);
            int inner = k.add_rectangle(r0, supra.z[0], w, height);
            ctx.lineage.discard({{2, inner}});
            run_boolean(ctx, BooleanOp::Cut, {{2, outer}}, {{2, inner}}, true);
            // Isolant layers and the frame are one material
            if (!isolants.empty()) {
                run_boolean(ctx, BooleanOp::Fuse, ctx.lineage.resolve(frame.id),
                            resolve_all(ctx, isolants), true);
            }
        }

        add_box_boundaries(ctx, path, r0 - ins, supra.r[1] + ins, supra.z[0] - ins,
                           supra.z[1] + ins, PLATE_BOUNDARIES);
    });
}

void build_screen(BuildContext& ctx, const Screen& screen, const std::vector<std::string>& prefix) {
    const auto path = child_path(prefix, screen.name);
    ctx.session.guarded(join_path(path), [&](Kernel& k) {
        ctx.add_solid(path, Category::Structure,
                      k.add_rectangle(screen.r[0], screen.z[0], screen.r[1] - screen.r[0],
                                      screen.z[1] - screen.z[0]));
        add_box_boundaries(ctx, path, screen.r[0], screen.r[1], screen.z[0], screen.z[1],
                           PLATE_BOUNDARIES);
    });
}

void build_site(BuildContext& ctx, const MSite& site, const std::vector<std::string>& prefix) {
    const auto path = child_path(prefix, site.name);
    std::vector<std::string> refs = site.magnets;
    refs.insert(refs.end(), site.screens.begin(), site.screens.end());
    for (const auto& ref : refs) {
        const GeometryNode* child = ctx.model.find(ref);
        if (!child) {
            throw ValidationError(site.name + ": unresolved reference '" + ref + "'");
        }
        if (kind_of(*child) == GeometryKind::MSite) {
            throw UnsupportedGeometryKind("MSite", "site '" + site.name +
                                                   "' references site '" + ref + "'");
        }
        build_node(ctx, *child, path);
    }
}

void build_node(BuildContext& ctx, const GeometryNode& node, const std::vector<std::string>& prefix) {
    std::visit([&](auto&& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, Bitter>) {
            build_bitter(ctx, arg, prefix);
        } else if constexpr (std::is_same_v<T, Bitters>) {
            for (const auto& magnet : arg.magnets) {
                build_bitter(ctx, magnet, child_path(prefix, arg.name));
            }
        } else if constexpr (std::is_same_v<T, Supra>) {
            build_supra(ctx, arg, prefix);
        } else if constexpr (std::is_same_v<T, Supras>) {
            for (const auto& magnet : arg.magnets) {
                build_supra(ctx, magnet, child_path(prefix, arg.name));
            }
        } else if constexpr (std::is_same_v<T, Helix>) {
            build_helix(ctx, arg, prefix);
        } else if constexpr (std::is_same_v<T, Insert>) {
            build_insert(ctx, arg, prefix);
        } else if constexpr (std::is_same_v<T, MSite>) {
            build_site(ctx, arg, prefix);
        } else if constexpr (std::is_same_v<T, Screen>) {
            build_screen(ctx, arg, prefix);
        } else if constexpr (std::is_same_v<T, Ring>) {
            throw UnsupportedGeometryKind("Ring", "ring '" + arg.name +
                                                  "' is only built as part of an insert");
        } else {
            static_assert(unhandled_kind_v<T>, "geometry kind without a builder");
        }
    }, node);
}

}  // namespace magnetmesh
