#include "geometry_model.hpp"

#include <common/errors.hpp>
#include <math/vec3.hpp>

#include <algorithm>
#include <cmath>
#include <type_traits>

namespace magnetmesh {

double AxialModel::total_height() const {
    double total = 0.0;
    for (std::size_t i = 0; i < turns.size() && i < pitch.size(); ++i) {
        total += section_height(i);
    }
    return total;
}

double Chamfer::radial_extent() const {
    return length * std::tan(degrees_to_radians(alpha));
}

GeometryKind kind_of(const GeometryNode& node) {
    return std::visit([](auto&& arg) -> GeometryKind {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, Bitter>) return GeometryKind::Bitter;
        else if constexpr (std::is_same_v<T, Bitters>) return GeometryKind::Bitters;
        else if constexpr (std::is_same_v<T, Supra>) return GeometryKind::Supra;
        else if constexpr (std::is_same_v<T, Supras>) return GeometryKind::Supras;
        else if constexpr (std::is_same_v<T, Helix>) return GeometryKind::Helix;
        else if constexpr (std::is_same_v<T, Insert>) return GeometryKind::Insert;
        else if constexpr (std::is_same_v<T, MSite>) return GeometryKind::MSite;
        else if constexpr (std::is_same_v<T, Ring>) return GeometryKind::Ring;
        else if constexpr (std::is_same_v<T, Screen>) return GeometryKind::Screen;
        else static_assert(unhandled_kind_v<T>, "geometry kind without a tag");
    }, node);
}

const std::string& name_of(const GeometryNode& node) {
    return std::visit([](auto&& arg) -> const std::string& { return arg.name; }, node);
}

std::string kind_name(GeometryKind kind) {
    switch (kind) {
        case GeometryKind::Bitter: return "Bitter";
        case GeometryKind::Bitters: return "Bitters";
        case GeometryKind::Supra: return "Supra";
        case GeometryKind::Supras: return "Supras";
        case GeometryKind::Helix: return "Helix";
        case GeometryKind::Insert: return "Insert";
        case GeometryKind::MSite: return "MSite";
        case GeometryKind::Ring: return "Ring";
        case GeometryKind::Screen: return "Screen";
    }
    return "Unknown";
}

std::string detail_name(SupraDetail detail) {
    switch (detail) {
        case SupraDetail::None: return "None";
        case SupraDetail::DblPancake: return "dblpancake";
        case SupraDetail::Pancake: return "pancake";
        case SupraDetail::Tape: return "tape";
    }
    return "unknown";
}

SupraDetail detail_from_name(const std::string& name) {
    for (auto detail : {SupraDetail::None, SupraDetail::DblPancake, SupraDetail::Pancake,
                        SupraDetail::Tape}) {
        if (detail_name(detail) == name) return detail;
    }
    throw ValidationError("unknown supra detail '" + name + "'");
}

double Supra::dblpancake_height() const {
    return (z[1] - z[0] - isolant * (pancakes - 1)) / pancakes;
}

double Supra::pancake_height() const {
    return (dblpancake_height() - pancake_isolant) / 2.0;
}

double Supra::tape_width() const {
    return (r[1] - r[0] - mandrel) / tapes;
}

void AxiExtent::merge(const AxiExtent& other) {
    r_min = std::min(r_min, other.r_min);
    r_max = std::max(r_max, other.r_max);
    z_min = std::min(z_min, other.z_min);
    z_max = std::max(z_max, other.z_max);
}

bool AxiExtent::overlaps_radially(const AxiExtent& other) const {
    return r_min < other.r_max && other.r_min < r_max;
}

std::array<double, 2> ring_axial_range(const Insert& insert, std::size_t i) {
    const Ring& ring = insert.rings.at(i);
    const Helix& helix = insert.helices.at(i);
    const double height = ring.z[1] - ring.z[0];
    // Rings alternate between the top and the bottom of consecutive helices
    double base = (i % 2 == 0) ? helix.z[1] : helix.z[0] - height;
    return {base + ring.z[0], base + ring.z[1]};
}

const GeometryNode* GeometryModel::find(const std::string& name) const {
    for (const auto& node : nodes) {
        if (name_of(node) == name) {
            return &node;
        }
    }
    return nullptr;
}

const GeometryNode& GeometryModel::root_node() const {
    if (nodes.empty()) {
        throw ValidationError("geometry model has no nodes");
    }
    if (root.empty()) {
        return nodes.front();
    }
    const GeometryNode* node = find(root);
    if (!node) {
        throw ValidationError("root node '" + root + "' not found in geometry model");
    }
    return *node;
}

namespace {

AxiExtent rz_extent(const std::array<double, 2>& r, const std::array<double, 2>& z) {
    return {r[0], r[1], z[0], z[1]};
}

template <typename Magnet>
AxiExtent collection_extent(const std::vector<Magnet>& magnets) {
    AxiExtent result = rz_extent(magnets.front().r, magnets.front().z);
    for (const auto& m : magnets) {
        result.merge(rz_extent(m.r, m.z));
    }
    return result;
}

}  // namespace

AxiExtent GeometryModel::extent(const GeometryNode& node) const {
    return std::visit([this](auto&& arg) -> AxiExtent {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, Bitter> || std::is_same_v<T, Supra> ||
                      std::is_same_v<T, Helix> || std::is_same_v<T, Screen>) {
            return rz_extent(arg.r, arg.z);
        } else if constexpr (std::is_same_v<T, Ring>) {
            return {arg.r[0], arg.r[3], arg.z[0], arg.z[1]};
        } else if constexpr (std::is_same_v<T, Bitters> || std::is_same_v<T, Supras>) {
            if (arg.magnets.empty()) {
                throw ValidationError(arg.name + ": collection without magnets");
            }
            return collection_extent(arg.magnets);
        } else if constexpr (std::is_same_v<T, Insert>) {
            if (arg.helices.empty()) {
                throw ValidationError(arg.name + ": insert without helices");
            }
            AxiExtent result = collection_extent(arg.helices);
            for (std::size_t i = 0; i < arg.rings.size(); ++i) {
                auto [z0, z1] = ring_axial_range(arg, i);
                result.merge({arg.rings[i].r[0], arg.rings[i].r[3], z0, z1});
            }
            return result;
        } else if constexpr (std::is_same_v<T, MSite>) {
            std::optional<AxiExtent> result;
            auto add = [&](const std::string& ref) {
                const GeometryNode* child = find(ref);
                if (!child) {
                    throw ValidationError(arg.name + ": unresolved reference '" + ref + "'");
                }
                AxiExtent e = extent(*child);
                if (result) result->merge(e); else result = e;
            };
            for (const auto& ref : arg.magnets) add(ref);
            for (const auto& ref : arg.screens) add(ref);
            if (!result) {
                throw ValidationError(arg.name + ": site without magnets");
            }
            return *result;
        } else {
            static_assert(unhandled_kind_v<T>, "geometry kind without an extent");
        }
    }, node);
}

}  // namespace magnetmesh
