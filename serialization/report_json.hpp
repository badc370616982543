#ifndef MAGNETMESH_SERIALIZATION_REPORT_JSON_HPP
#define MAGNETMESH_SERIALIZATION_REPORT_JSON_HPP

#include "config_json.hpp"
#include "json_serialization.hpp"
#include <compiler/geometry_compiler.hpp>

#include <nlohmann/json.hpp>
#include <string>

namespace magnetmesh {

// PhysicalGroup serialization
inline void to_json(nlohmann::json& j, const PhysicalGroup& group) {
    j = {
        {"name", group.name},
        {"category", category_name(group.category)},
        {"dim", group.dim},
        {"tags", group.tags}
    };
}

// Names with their tag count and, for fused names, the survivor
inline nlohmann::json lineage_summary(const NamingRegistry& registry, const EntityLineage& lineage) {
    nlohmann::json names = nlohmann::json::array();
    for (const auto& name : registry.names()) {
        if (!lineage.is_bound(name.id)) continue;
        nlohmann::json entry = {
            {"path", name.path},
            {"category", category_name(name.category)},
            {"tags", lineage.resolve(name.id).size()}
        };
        NameId root = lineage.canonical(name.id);
        if (root != name.id) entry["merged_into"] = registry.get(root).path;
        if (lineage.consumed(name.id)) entry["consumed"] = true;
        names.push_back(entry);
    }
    return names;
}

// Report of one compilation of the named model
inline json::Report compile_report(const CompileResult& result, const CompileOptions& options,
                                   const std::string& model,
                                   const std::string& source_file = "") {
    json::Report report;
    report.pipeline = "compile";
    report.model = model;
    report.created_at = json::utc_timestamp();
    report.source_file = source_file;
    report.config = options;

    nlohmann::json unresolved = nlohmann::json::array();
    for (const auto& t : result.unresolved) {
        unresolved.push_back({t.dim, t.tag});
    }
    report.stats = {
        {"names", result.registry.size()},
        {"groups", result.groups.size()},
        {"conductors", result.groups.count(Category::Conductor)},
        {"channels", result.groups.count(Category::Channel)},
        {"isolants", result.groups.count(Category::Isolant)},
        {"generation", result.lineage.generation()},
        {"merges", result.lineage.merges().size()}
    };
    report.data = {
        {"dim", result.dim},
        {"groups", result.groups.groups()},
        {"names", lineage_summary(result.registry, result.lineage)},
        {"unresolved", unresolved},
        {"warnings", result.warnings}
    };
    return report;
}

}  // namespace magnetmesh

#endif // MAGNETMESH_SERIALIZATION_REPORT_JSON_HPP
