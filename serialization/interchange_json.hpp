#ifndef MAGNETMESH_SERIALIZATION_INTERCHANGE_JSON_HPP
#define MAGNETMESH_SERIALIZATION_INTERCHANGE_JSON_HPP

#include "config_json.hpp"
#include <common/errors.hpp>
#include <interchange/interchange_document.hpp>

#include <nlohmann/json.hpp>
#include <string>

namespace magnetmesh {

// BoundingBox as [xmin, ymin, zmin, xmax, ymax, zmax]
inline void to_json(nlohmann::json& j, const BoundingBox& box) {
    j = nlohmann::json::array({box.min.x, box.min.y, box.min.z, box.max.x, box.max.y, box.max.z});
}

inline void from_json(const nlohmann::json& j, BoundingBox& box) {
    if (!j.is_array() || j.size() != 6) {
        throw ValidationError("bounding box must list 6 numbers: " + j.dump());
    }
    box = BoundingBox::from_corners({j[0].get<double>(), j[1].get<double>(), j[2].get<double>()},
                                    {j[3].get<double>(), j[4].get<double>(), j[5].get<double>()});
}

// Locator serialization
inline void to_json(nlohmann::json& j, const Locator& locator) {
    j = {{"centroid", locator.centroid}};
    if (locator.bbox) j["bbox"] = *locator.bbox;
}

inline void from_json(const nlohmann::json& j, Locator& locator) {
    locator.centroid = j.at("centroid").get<Vec3>();
    if (j.contains("bbox")) locator.bbox = j["bbox"].get<BoundingBox>();
}

// InterchangeGroup serialization
inline void to_json(nlohmann::json& j, const InterchangeGroup& group) {
    j = {
        {"name", group.name},
        {"dimension", dimension_name(group.dimension)},
        {"locators", group.locators}
    };
}

inline void from_json(const nlohmann::json& j, InterchangeGroup& group) {
    group.name = j.at("name").get<std::string>();
    group.dimension = dimension_from_name(j.value("dimension", "solid"));
    group.locators = j.value("locators", std::vector<Locator>{});
}

// InterchangeDocument serialization
inline void to_json(nlohmann::json& j, const InterchangeDocument& document) {
    j = {
        {"geometry", {
            {"name", document.name},
            {"shape", {{"format", document.shape_format}, {"file", document.shape_file}}}
        }},
        {"groups", document.groups}
    };
}

inline void from_json(const nlohmann::json& j, InterchangeDocument& document) {
    const auto& geometry = j.at("geometry");
    document.name = geometry.value("name", "");
    if (geometry.contains("shape")) {
        document.shape_format = geometry["shape"].value("format", "BREP");
        document.shape_file = geometry["shape"].value("file", "");
    }
    document.groups = j.value("groups", std::vector<InterchangeGroup>{});
}

inline InterchangeDocument interchange_from_json(const nlohmann::json& j) {
    try {
        return j.get<InterchangeDocument>();
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError(std::string("malformed interchange document: ") + e.what());
    }
}

}  // namespace magnetmesh

#endif // MAGNETMESH_SERIALIZATION_INTERCHANGE_JSON_HPP
