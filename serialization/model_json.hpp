#ifndef MAGNETMESH_SERIALIZATION_MODEL_JSON_HPP
#define MAGNETMESH_SERIALIZATION_MODEL_JSON_HPP

#include <common/errors.hpp>
#include <model/geometry_model.hpp>

#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>

namespace magnetmesh {

// AxialModel serialization
inline void to_json(nlohmann::json& j, const AxialModel& axial) {
    j = {{"h", axial.h}, {"turns", axial.turns}, {"pitch", axial.pitch}};
}

inline void from_json(const nlohmann::json& j, AxialModel& axial) {
    axial.h = j.value("h", 0.0);
    axial.turns = j.value("turns", std::vector<double>{});
    axial.pitch = j.value("pitch", std::vector<double>{});
}

// Chamfer serialization
inline void to_json(nlohmann::json& j, const Chamfer& chamfer) {
    j = {
        {"side", chamfer.side == EndSide::HP ? "HP" : "BP"},
        {"rside", chamfer.radial_side == RadialSide::Inner ? "rint" : "rext"},
        {"alpha", chamfer.alpha},
        {"L", chamfer.length}
    };
}

inline void from_json(const nlohmann::json& j, Chamfer& chamfer) {
    std::string side = j.value("side", "HP");
    std::string rside = j.value("rside", "rint");
    if (side != "HP" && side != "BP") {
        throw ValidationError("chamfer side must be HP or BP, got '" + side + "'");
    }
    if (rside != "rint" && rside != "rext") {
        throw ValidationError("chamfer rside must be rint or rext, got '" + rside + "'");
    }
    chamfer.side = side == "HP" ? EndSide::HP : EndSide::BP;
    chamfer.radial_side = rside == "rint" ? RadialSide::Inner : RadialSide::Outer;
    chamfer.alpha = j.value("alpha", 0.0);
    chamfer.length = j.value("L", 0.0);
}

// CoolingSlit and TieRod serialization
inline void to_json(nlohmann::json& j, const CoolingSlit& slit) {
    j = {{"r", slit.r}, {"n", slit.n}, {"angle", slit.angle}, {"shape", slit.shape}};
}

inline void from_json(const nlohmann::json& j, CoolingSlit& slit) {
    slit.r = j.value("r", 0.0);
    slit.n = j.value("n", 0);
    slit.angle = j.value("angle", 0.0);
    slit.shape = j.value("shape", Outline{});
}

inline void to_json(nlohmann::json& j, const TieRod& tierod) {
    j = {{"r", tierod.r}, {"n", tierod.n}, {"shape", tierod.shape}};
}

inline void from_json(const nlohmann::json& j, TieRod& tierod) {
    tierod.r = j.value("r", 0.0);
    tierod.n = j.value("n", 0);
    tierod.shape = j.value("shape", Outline{});
}

// Node kinds
inline void to_json(nlohmann::json& j, const Bitter& bitter) {
    j = {
        {"type", "Bitter"},
        {"name", bitter.name},
        {"r", bitter.r},
        {"z", bitter.z},
        {"axial", bitter.axial},
        {"coolingslits", bitter.cooling_slits}
    };
    if (bitter.tierod) j["tierod"] = *bitter.tierod;
}

inline void from_json(const nlohmann::json& j, Bitter& bitter) {
    bitter.name = j.at("name").get<std::string>();
    bitter.r = j.at("r").get<std::array<double, 2>>();
    bitter.z = j.at("z").get<std::array<double, 2>>();
    bitter.axial = j.value("axial", AxialModel{});
    bitter.cooling_slits = j.value("coolingslits", std::vector<CoolingSlit>{});
    if (j.contains("tierod")) bitter.tierod = j["tierod"].get<TieRod>();
}

inline void to_json(nlohmann::json& j, const Helix& helix) {
    j = {
        {"type", "Helix"},
        {"name", helix.name},
        {"r", helix.r},
        {"z", helix.z},
        {"axial", helix.axial},
        {"chamfers", helix.chamfers}
    };
}

inline void from_json(const nlohmann::json& j, Helix& helix) {
    helix.name = j.at("name").get<std::string>();
    helix.r = j.at("r").get<std::array<double, 2>>();
    helix.z = j.at("z").get<std::array<double, 2>>();
    helix.axial = j.value("axial", AxialModel{});
    helix.chamfers = j.value("chamfers", std::vector<Chamfer>{});
}

inline void to_json(nlohmann::json& j, const Ring& ring) {
    j = {{"type", "Ring"}, {"name", ring.name}, {"r", ring.r}, {"z", ring.z}};
}

inline void from_json(const nlohmann::json& j, Ring& ring) {
    ring.name = j.at("name").get<std::string>();
    ring.r = j.at("r").get<std::array<double, 4>>();
    ring.z = j.at("z").get<std::array<double, 2>>();
}

inline void to_json(nlohmann::json& j, const Screen& screen) {
    j = {{"type", "Screen"}, {"name", screen.name}, {"r", screen.r}, {"z", screen.z}};
}

inline void from_json(const nlohmann::json& j, Screen& screen) {
    screen.name = j.at("name").get<std::string>();
    screen.r = j.at("r").get<std::array<double, 2>>();
    screen.z = j.at("z").get<std::array<double, 2>>();
}

inline void to_json(nlohmann::json& j, const Supra& supra) {
    j = {
        {"type", "Supra"},
        {"name", supra.name},
        {"r", supra.r},
        {"z", supra.z},
        {"pancakes", supra.pancakes},
        {"isolant", supra.isolant},
        {"insulation", supra.insulation},
        {"detail", detail_name(supra.detail)}
    };
    if (supra.detail == SupraDetail::Pancake || supra.detail == SupraDetail::Tape) {
        j["pancake_isolant"] = supra.pancake_isolant;
    }
    if (supra.detail == SupraDetail::Tape) {
        j["mandrel"] = supra.mandrel;
        j["tapes"] = supra.tapes;
        j["duromag"] = supra.duromag;
    }
}

inline void from_json(const nlohmann::json& j, Supra& supra) {
    supra.name = j.at("name").get<std::string>();
    supra.r = j.at("r").get<std::array<double, 2>>();
    supra.z = j.at("z").get<std::array<double, 2>>();
    supra.pancakes = j.value("pancakes", 0);
    supra.isolant = j.value("isolant", 0.0);
    supra.insulation = j.value("insulation", 0.0);
    supra.detail = detail_from_name(j.value("detail", "dblpancake"));
    supra.pancake_isolant = j.value("pancake_isolant", 0.0);
    supra.mandrel = j.value("mandrel", 0.0);
    supra.tapes = j.value("tapes", 0);
    supra.duromag = j.value("duromag", 0.0);
}

inline void to_json(nlohmann::json& j, const Insert& insert) {
    j = {
        {"type", "Insert"},
        {"name", insert.name},
        {"helices", insert.helices},
        {"rings", insert.rings},
        {"innerbore", insert.innerbore},
        {"outerbore", insert.outerbore}
    };
}

inline void from_json(const nlohmann::json& j, Insert& insert) {
    insert.name = j.at("name").get<std::string>();
    insert.helices = j.value("helices", std::vector<Helix>{});
    insert.rings = j.value("rings", std::vector<Ring>{});
    insert.innerbore = j.value("innerbore", 0.0);
    insert.outerbore = j.value("outerbore", 0.0);
}

inline void to_json(nlohmann::json& j, const Bitters& bitters) {
    j = {
        {"type", "Bitters"},
        {"name", bitters.name},
        {"magnets", bitters.magnets},
        {"innerbore", bitters.innerbore},
        {"outerbore", bitters.outerbore}
    };
}

inline void from_json(const nlohmann::json& j, Bitters& bitters) {
    bitters.name = j.at("name").get<std::string>();
    bitters.magnets = j.value("magnets", std::vector<Bitter>{});
    bitters.innerbore = j.value("innerbore", 0.0);
    bitters.outerbore = j.value("outerbore", 0.0);
}

inline void to_json(nlohmann::json& j, const Supras& supras) {
    j = {
        {"type", "Supras"},
        {"name", supras.name},
        {"magnets", supras.magnets},
        {"innerbore", supras.innerbore},
        {"outerbore", supras.outerbore}
    };
}

inline void from_json(const nlohmann::json& j, Supras& supras) {
    supras.name = j.at("name").get<std::string>();
    supras.magnets = j.value("magnets", std::vector<Supra>{});
    supras.innerbore = j.value("innerbore", 0.0);
    supras.outerbore = j.value("outerbore", 0.0);
}

inline void to_json(nlohmann::json& j, const MSite& site) {
    j = {
        {"type", "MSite"},
        {"name", site.name},
        {"magnets", site.magnets},
        {"screens", site.screens}
    };
}

inline void from_json(const nlohmann::json& j, MSite& site) {
    site.name = j.at("name").get<std::string>();
    site.magnets = j.value("magnets", std::vector<std::string>{});
    site.screens = j.value("screens", std::vector<std::string>{});
}

// GeometryNode dispatches on "type"
inline nlohmann::json node_to_json(const GeometryNode& node) {
    return std::visit([](auto&& arg) { return nlohmann::json(arg); }, node);
}

inline GeometryNode node_from_json(const nlohmann::json& j) {
    if (!j.contains("type")) {
        throw ValidationError("geometry node without a type: " + j.dump());
    }
    const std::string type = j["type"].get<std::string>();
    if (type == "Bitter") return j.get<Bitter>();
    if (type == "Bitters") return j.get<Bitters>();
    if (type == "Supra") return j.get<Supra>();
    if (type == "Supras") return j.get<Supras>();
    if (type == "Helix") return j.get<Helix>();
    if (type == "Insert") return j.get<Insert>();
    if (type == "MSite") return j.get<MSite>();
    if (type == "Ring") return j.get<Ring>();
    if (type == "Screen") return j.get<Screen>();
    throw UnsupportedGeometryKind(type, "unknown node type in geometry document");
}

// GeometryModel serialization
inline void to_json(nlohmann::json& j, const GeometryModel& model) {
    nlohmann::json nodes = nlohmann::json::array();
    for (const auto& node : model.nodes) {
        nodes.push_back(node_to_json(node));
    }
    j = {{"root", model.root}, {"nodes", nodes}};
}

inline void from_json(const nlohmann::json& j, GeometryModel& model) {
    model.root = j.value("root", "");
    model.nodes.clear();
    if (!j.contains("nodes")) {
        throw ValidationError("geometry document without nodes");
    }
    for (const auto& node : j["nodes"]) {
        model.nodes.push_back(node_from_json(node));
    }
}

// Reads a geometry document; nlohmann type errors become ValidationError
inline GeometryModel model_from_json(const nlohmann::json& j) {
    try {
        return j.get<GeometryModel>();
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError(std::string("malformed geometry document: ") + e.what());
    }
}

}  // namespace magnetmesh

#endif // MAGNETMESH_SERIALIZATION_MODEL_JSON_HPP
