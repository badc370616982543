#ifndef MAGNETMESH_MODEL_GEOMETRY_MODEL_HPP
#define MAGNETMESH_MODEL_GEOMETRY_MODEL_HPP

#include <array>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace magnetmesh {

// Axial decomposition of a winding: section i spans turns[i] * pitch[i]
// along z, starting at -h
struct AxialModel {
    double h = 0.0;
    std::vector<double> turns;
    std::vector<double> pitch;

    double section_height(std::size_t i) const { return turns[i] * pitch[i]; }
    double total_height() const;
};

enum class EndSide { HP, BP };
enum class RadialSide { Inner, Outer };

struct Chamfer {
    EndSide side = EndSide::HP;
    RadialSide radial_side = RadialSide::Inner;
    double alpha = 0.0;   // degrees
    double length = 0.0;  // axial length

    // Radial extent removed from the end block
    double radial_extent() const;
};

// Planar (x, y) outline of a slit or tie rod hole, relative to its center
using Outline = std::vector<std::array<double, 2>>;

// n slits evenly spaced around the plate at radius r, the first one rotated
// by angle degrees
struct CoolingSlit {
    double r = 0.0;
    int n = 0;
    double angle = 0.0;
    Outline shape;
};

struct TieRod {
    double r = 0.0;
    int n = 0;
    Outline shape;
};

struct Bitter {
    std::string name;
    std::array<double, 2> r{};
    std::array<double, 2> z{};
    AxialModel axial;
    std::vector<CoolingSlit> cooling_slits;
    std::optional<TieRod> tierod;
};

struct Bitters {
    std::string name;
    std::vector<Bitter> magnets;
    double innerbore = 0.0;
    double outerbore = 0.0;
};

// Level at which an HTS coil is modelled: one bulk solid, one solid per
// double pancake, two pancakes per double pancake, or every tape
enum class SupraDetail { None, DblPancake, Pancake, Tape };

std::string detail_name(SupraDetail detail);
SupraDetail detail_from_name(const std::string& name);

struct Supra {
    std::string name;
    std::array<double, 2> r{};
    std::array<double, 2> z{};
    int pancakes = 0;           // double pancakes, 0 for a bulk coil
    double isolant = 0.0;       // thickness of the layer between double pancakes
    double insulation = 0.0;    // thickness of the outer insulation frame
    SupraDetail detail = SupraDetail::DblPancake;
    double pancake_isolant = 0.0;  // layer between the two pancakes of a double pancake
    // Tape level: each pancake is a mandrel followed radially by its tapes,
    // each tape a superconductor band then a co-wound duromag band
    double mandrel = 0.0;
    int tapes = 0;
    double duromag = 0.0;

    // Axial height of one double pancake
    double dblpancake_height() const;
    double pancake_height() const;
    double tape_width() const;
};

struct Supras {
    std::string name;
    std::vector<Supra> magnets;
    double innerbore = 0.0;
    double outerbore = 0.0;
};

struct Helix {
    std::string name;
    std::array<double, 2> r{};
    std::array<double, 2> z{};
    AxialModel axial;
    std::vector<Chamfer> chamfers;
};

// Connector between two consecutive helices; r spans both helices
struct Ring {
    std::string name;
    std::array<double, 4> r{};
    std::array<double, 2> z{};
};

struct Insert {
    std::string name;
    std::vector<Helix> helices;
    std::vector<Ring> rings;
    double innerbore = 0.0;
    double outerbore = 0.0;
};

// Axial range occupied by ring i once placed against helices i and i+1
std::array<double, 2> ring_axial_range(const Insert& insert, std::size_t i);

struct Screen {
    std::string name;
    std::array<double, 2> r{};
    std::array<double, 2> z{};
};

// Site made of magnets defined elsewhere in the model, referenced by name
struct MSite {
    std::string name;
    std::vector<std::string> magnets;
    std::vector<std::string> screens;
};

enum class GeometryKind { Bitter, Bitters, Supra, Supras, Helix, Insert, MSite, Ring, Screen };

using GeometryNode = std::variant<Bitter, Bitters, Supra, Supras, Helix, Insert, MSite, Ring, Screen>;

// Makes an if-constexpr chain over GeometryNode alternatives exhaustive
template <typename>
inline constexpr bool unhandled_kind_v = false;

GeometryKind kind_of(const GeometryNode& node);
const std::string& name_of(const GeometryNode& node);
std::string kind_name(GeometryKind kind);

// Radial and axial extent of a node in the (r, z) half plane
struct AxiExtent {
    double r_min = 0.0;
    double r_max = 0.0;
    double z_min = 0.0;
    double z_max = 0.0;

    void merge(const AxiExtent& other);
    bool overlaps_radially(const AxiExtent& other) const;
};

// Owned set of top-level nodes plus the node to compile; MSite references
// resolve against the top-level nodes
struct GeometryModel {
    std::vector<GeometryNode> nodes;
    std::string root;

    const GeometryNode* find(const std::string& name) const;
    const GeometryNode& root_node() const;

    // Extent of a node, following MSite references
    AxiExtent extent(const GeometryNode& node) const;
};

}  // namespace magnetmesh

#endif // MAGNETMESH_MODEL_GEOMETRY_MODEL_HPP
