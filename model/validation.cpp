#include "validation.hpp"

#include <common/errors.hpp>
#include <common/logging.hpp>
#include <naming/naming_registry.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <string_view>
#include <type_traits>

namespace magnetmesh {

namespace {

constexpr double RELATIVE_TOLERANCE = 1e-6;

void require(bool condition, const std::string& owner, const std::string& message) {
    if (!condition) {
        throw ValidationError(owner + ": " + message);
    }
}

bool close_to(double a, double b, double scale) {
    return std::abs(a - b) <= RELATIVE_TOLERANCE * std::max(1.0, std::abs(scale));
}

void check_radial(const std::string& owner, const std::array<double, 2>& r) {
    require(r[0] > 0.0, owner, "inner radius must be positive");
    require(r[1] > r[0], owner, "outer radius must exceed inner radius");
}

void check_axial_range(const std::string& owner, const std::array<double, 2>& z) {
    require(z[1] > z[0], owner, "upper z must exceed lower z");
}

void check_axial_model(const std::string& owner, const AxialModel& axial,
                       const std::array<double, 2>& z) {
    require(axial.h > 0.0, owner, "axial half height must be positive");
    require(!axial.turns.empty(), owner, "axial model has no sections");
    require(axial.turns.size() == axial.pitch.size(), owner,
            "turns and pitch have different sizes");
    for (std::size_t i = 0; i < axial.turns.size(); ++i) {
        require(axial.turns[i] > 0.0, owner, "turn count must be positive");
        require(axial.pitch[i] > 0.0, owner, "pitch must be positive");
    }
    require(close_to(axial.total_height(), 2.0 * axial.h, axial.h), owner,
            "sections do not add up to twice the axial half height");
    require(z[0] <= -axial.h + RELATIVE_TOLERANCE && z[1] >= axial.h - RELATIVE_TOLERANCE,
            owner, "axial model exceeds the z range");
}

// Names registered by the compiler at the top of the path
const char* const RESERVED_ROOT_NAMES[] = {"Air", "Infty", "Sym0", "Sym1"};

// Node names become path segments; a separator inside one would let two
// different paths join to the same semantic name
void check_name(const std::string& owner, const std::string& name) {
    require(!name.empty(), owner, "node without a name");
    require(name.find(PATH_SEPARATOR) == std::string::npos, owner,
            "name '" + name + "' contains the path separator '" + PATH_SEPARATOR + "'");
}

void check_unique(const std::string& owner, const std::vector<std::string>& names) {
    std::set<std::string> seen;
    for (const auto& name : names) {
        require(!name.empty(), owner, "child without a name");
        check_name(owner, name);
        require(seen.insert(name).second, owner, "duplicate child name '" + name + "'");
    }
}

// Siblings may share a radial band only if they are axially disjoint
void check_no_overlap(const std::string& owner, const std::vector<std::string>& names,
                      const std::vector<AxiExtent>& extents) {
    for (std::size_t i = 0; i < extents.size(); ++i) {
        for (std::size_t j = i + 1; j < extents.size(); ++j) {
            const auto& a = extents[i];
            const auto& b = extents[j];
            bool axial = a.z_min < b.z_max && b.z_min < a.z_max;
            require(!(axial && a.overlaps_radially(b)), owner,
                    "children '" + names[i] + "' and '" + names[j] + "' overlap");
        }
    }
}

void check(const Bitter& bitter) {
    check_name(bitter.name, bitter.name);
    check_radial(bitter.name, bitter.r);
    check_axial_range(bitter.name, bitter.z);
    check_axial_model(bitter.name, bitter.axial, bitter.z);
    for (const auto& slit : bitter.cooling_slits) {
        require(slit.r > bitter.r[0] && slit.r < bitter.r[1], bitter.name,
                "cooling slit radius outside the plate");
        require(slit.n >= 0, bitter.name, "negative cooling slit count");
    }
    if (bitter.tierod) {
        require(bitter.tierod->r > bitter.r[0] && bitter.tierod->r < bitter.r[1],
                bitter.name, "tie rod radius outside the plate");
        require(bitter.tierod->n > 0, bitter.name, "tie rod count must be positive");
    }
}

void check(const Supra& supra) {
    check_name(supra.name, supra.name);
    check_radial(supra.name, supra.r);
    check_axial_range(supra.name, supra.z);
    require(supra.pancakes >= 0, supra.name, "negative pancake count");
    require(supra.isolant >= 0.0 && supra.insulation >= 0.0, supra.name,
            "negative isolant thickness");
    require(supra.insulation < supra.r[0], supra.name, "insulation reaches the axis");
    if (supra.pancakes > 1) {
        require(supra.isolant > 0.0, supra.name, "stacked pancakes need an isolant layer");
        double isolants = supra.isolant * (supra.pancakes - 1);
        require(isolants < supra.z[1] - supra.z[0], supra.name,
                "isolant layers exceed the coil height");
    }
    if (supra.detail == SupraDetail::Pancake || supra.detail == SupraDetail::Tape) {
        require(supra.pancakes > 0, supra.name,
                detail_name(supra.detail) + " detail needs double pancakes");
        require(supra.pancake_isolant > 0.0, supra.name,
                "pancakes of a double pancake need an isolant layer");
        require(supra.pancake_isolant < supra.dblpancake_height(), supra.name,
                "pancake isolant exceeds the double pancake height");
    }
    if (supra.detail == SupraDetail::Tape) {
        require(supra.tapes > 0, supra.name, "tape count must be positive");
        require(supra.mandrel >= 0.0 && supra.mandrel < supra.r[1] - supra.r[0], supra.name,
                "mandrel must be thinner than the coil");
        require(supra.duromag >= 0.0 && supra.duromag < supra.tape_width(), supra.name,
                "duromag must be thinner than a tape");
    }
}

void check(const Helix& helix) {
    check_name(helix.name, helix.name);
    check_radial(helix.name, helix.r);
    check_axial_range(helix.name, helix.z);
    check_axial_model(helix.name, helix.axial, helix.z);
    for (const auto& chamfer : helix.chamfers) {
        require(chamfer.alpha > 0.0 && chamfer.alpha < 90.0, helix.name,
                "chamfer angle must be within (0, 90) degrees");
        require(chamfer.length > 0.0, helix.name, "chamfer length must be positive");
        double block = chamfer.side == EndSide::HP ? -helix.axial.h - helix.z[0]
                                                   : helix.z[1] - helix.axial.h;
        require(chamfer.length <= block + RELATIVE_TOLERANCE, helix.name,
                "chamfer longer than the end block");
        require(chamfer.radial_extent() < helix.r[1] - helix.r[0], helix.name,
                "chamfer wider than the helix");
    }
}

void check(const Ring& ring) {
    check_name(ring.name, ring.name);
    require(ring.r[0] > 0.0, ring.name, "inner radius must be positive");
    require(ring.r[0] < ring.r[1] && ring.r[1] <= ring.r[2] && ring.r[2] < ring.r[3],
            ring.name, "radii must be increasing");
    check_axial_range(ring.name, ring.z);
}

void check(const Screen& screen) {
    check_name(screen.name, screen.name);
    check_radial(screen.name, screen.r);
    check_axial_range(screen.name, screen.z);
}

template <typename Magnet>
void check_collection(const std::string& owner, const std::vector<Magnet>& magnets) {
    require(!magnets.empty(), owner, "collection without magnets");
    std::vector<std::string> names;
    std::vector<AxiExtent> extents;
    for (const auto& m : magnets) {
        check(m);
        names.push_back(m.name);
        extents.push_back({m.r[0], m.r[1], m.z[0], m.z[1]});
    }
    check_unique(owner, names);
    check_no_overlap(owner, names, extents);
}

bool is_channel_name(const std::string& name) {
    constexpr std::string_view prefix = "Channel";
    return name.size() > prefix.size() && name.compare(0, prefix.size(), prefix) == 0 &&
           std::all_of(name.begin() + prefix.size(), name.end(),
                       [](unsigned char c) { return std::isdigit(c); });
}

void check(const Insert& insert) {
    check_name(insert.name, insert.name);
    check_collection(insert.name, insert.helices);
    require(insert.rings.empty() || insert.rings.size() + 1 == insert.helices.size(),
            insert.name, "an insert needs one ring between each pair of helices");
    for (std::size_t i = 0; i < insert.rings.size(); ++i) {
        const Ring& ring = insert.rings[i];
        check(ring);
        const Helix& inner = insert.helices[i];
        const Helix& outer = insert.helices[i + 1];
        require(close_to(ring.r[0], inner.r[0], inner.r[0]) &&
                close_to(ring.r[3], outer.r[1], outer.r[1]),
                insert.name, "ring '" + ring.name + "' does not span its helices");
    }
    // Helices and rings share the insert prefix, channels are named by the insert
    std::vector<std::string> members;
    for (const auto& helix : insert.helices) members.push_back(helix.name);
    for (const auto& ring : insert.rings) members.push_back(ring.name);
    check_unique(insert.name, members);
    for (const auto& member : members) {
        require(!is_channel_name(member), insert.name,
                "member '" + member + "' takes the name of a cooling channel");
    }
    require(insert.innerbore >= 0.0 && insert.outerbore >= 0.0, insert.name,
            "negative bore radius");
}

}  // namespace

void validate(const GeometryNode& node, const GeometryModel& model) {
    std::visit([&](auto&& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, Bitter> || std::is_same_v<T, Supra> ||
                      std::is_same_v<T, Helix> || std::is_same_v<T, Ring> ||
                      std::is_same_v<T, Screen> || std::is_same_v<T, Insert>) {
            check(arg);
        } else if constexpr (std::is_same_v<T, Bitters> || std::is_same_v<T, Supras>) {
            check_name(arg.name, arg.name);
            check_collection(arg.name, arg.magnets);
        } else if constexpr (std::is_same_v<T, MSite>) {
            std::vector<std::string> refs = arg.magnets;
            refs.insert(refs.end(), arg.screens.begin(), arg.screens.end());
            check_name(arg.name, arg.name);
            require(!arg.magnets.empty(), arg.name, "site without magnets");
            check_unique(arg.name, refs);
            std::vector<AxiExtent> extents;
            for (const auto& ref : refs) {
                const GeometryNode* child = model.find(ref);
                require(child != nullptr, arg.name, "unresolved reference '" + ref + "'");
                // Nested sites are rejected by the compiler as an unsupported kind
                if (kind_of(*child) != GeometryKind::MSite) {
                    validate(*child, model);
                    extents.push_back(model.extent(*child));
                } else {
                    extents.push_back({});
                }
            }
            check_no_overlap(arg.name, refs, extents);
        } else {
            static_assert(unhandled_kind_v<T>, "geometry kind without validation");
        }
    }, node);
}

void validate(const GeometryModel& model) {
    auto log = logging::get_logger();
    std::vector<std::string> names;
    for (const auto& node : model.nodes) {
        names.push_back(name_of(node));
    }
    check_unique("model", names);
    const GeometryNode& root = model.root_node();
    for (const char* reserved : RESERVED_ROOT_NAMES) {
        require(name_of(root) != reserved, name_of(root), "name is reserved for the assembly");
    }
    log->debug("Validating {} '{}'", kind_name(kind_of(root)), name_of(root));
    validate(root, model);
}

}  // namespace magnetmesh
