#include "mesh_sizing_policy.hpp"

#include <common/errors.hpp>
#include <naming/naming_registry.hpp>

#include <cmath>
#include <type_traits>

namespace magnetmesh {

namespace {

void check_length(double length, const std::string& what) {
    if (!(length > 0.0) || !std::isfinite(length)) {
        throw ValidationError("mesh size for " + what + " must be positive, got " +
                              std::to_string(length));
    }
}

std::string prefixed(const std::vector<std::string>& prefix, const std::string& name) {
    std::vector<std::string> path = prefix;
    path.push_back(name);
    return join_path(path);
}

void add_defaults(MeshSizingPolicy& policy, const GeometryModel& model, const GeometryNode& node,
                  const std::vector<std::string>& prefix) {
    std::visit([&](auto&& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, Bitter> || std::is_same_v<T, Supra>) {
            policy.add_component(prefixed(prefix, arg.name), (arg.r[1] - arg.r[0]) / 5.0);
        } else if constexpr (std::is_same_v<T, Helix>) {
            policy.add_component(prefixed(prefix, arg.name), (arg.r[1] - arg.r[0]) / 3.0);
        } else if constexpr (std::is_same_v<T, Ring>) {
            policy.add_component(prefixed(prefix, arg.name), (arg.r[3] - arg.r[0]) / 10.0);
        } else if constexpr (std::is_same_v<T, Bitters> || std::is_same_v<T, Supras>) {
            auto path = prefix;
            path.push_back(arg.name);
            for (const auto& magnet : arg.magnets) {
                add_defaults(policy, model, GeometryNode{magnet}, path);
            }
        } else if constexpr (std::is_same_v<T, Insert>) {
            auto path = prefix;
            path.push_back(arg.name);
            for (const auto& helix : arg.helices) {
                add_defaults(policy, model, GeometryNode{helix}, path);
            }
            for (const auto& ring : arg.rings) {
                add_defaults(policy, model, GeometryNode{ring}, path);
            }
        } else if constexpr (std::is_same_v<T, MSite>) {
            auto path = prefix;
            path.push_back(arg.name);
            for (const auto& ref : arg.magnets) {
                if (const GeometryNode* child = model.find(ref)) {
                    add_defaults(policy, model, *child, path);
                }
            }
        } else if constexpr (std::is_same_v<T, Screen>) {
            // screens use the global length
        } else {
            static_assert(unhandled_kind_v<T>, "geometry kind without default mesh size");
        }
    }, node);
}

}  // namespace

std::string scope_name(SizingScope scope) {
    switch (scope) {
        case SizingScope::Global: return "global";
        case SizingScope::Component: return "component";
        case SizingScope::Surface: return "surface";
    }
    return "unknown";
}

bool path_matches(const std::string& prefix, const std::string& path) {
    if (path.compare(0, prefix.size(), prefix) != 0) return false;
    return path.size() == prefix.size() ||
           path.compare(prefix.size(), 1, PATH_SEPARATOR) == 0;
}

MeshSizingPolicy::MeshSizingPolicy(double default_length) : default_length_(default_length) {
    check_length(default_length, "the default");
}

void MeshSizingPolicy::add_rule(const SizingRule& rule) {
    switch (rule.scope) {
        case SizingScope::Global:
            check_length(rule.length, "the global rule");
            break;
        case SizingScope::Component:
            if (rule.target.empty()) {
                throw ValidationError("component mesh size rule without a path");
            }
            check_length(rule.length, "'" + rule.target + "'");
            break;
        case SizingScope::Surface:
            check_length(rule.length, "surface " + std::to_string(rule.surface));
            break;
    }
    rules_.push_back(rule);
}

void MeshSizingPolicy::add_global(double length) {
    add_rule({SizingScope::Global, "", 0, length});
}

void MeshSizingPolicy::add_component(const std::string& path, double length) {
    add_rule({SizingScope::Component, path, 0, length});
}

void MeshSizingPolicy::add_surface(int surface, double length) {
    add_rule({SizingScope::Surface, "", surface, length});
}

double MeshSizingPolicy::resolve(int surface, const std::string& component_path) const {
    const SizingRule* by_surface = nullptr;
    const SizingRule* by_component = nullptr;
    const SizingRule* global = nullptr;
    for (const auto& rule : rules_) {
        switch (rule.scope) {
            case SizingScope::Surface:
                if (rule.surface == surface) by_surface = &rule;
                break;
            case SizingScope::Component:
                if (path_matches(rule.target, component_path) &&
                    (!by_component || rule.target.size() >= by_component->target.size())) {
                    by_component = &rule;
                }
                break;
            case SizingScope::Global:
                global = &rule;
                break;
        }
    }
    if (by_surface) return by_surface->length;
    if (by_component) return by_component->length;
    if (global) return global->length;
    return default_length_;
}

MeshSizingPolicy MeshSizingPolicy::from_model(const GeometryModel& model,
                                              const std::optional<AirOptions>& air,
                                              double default_length) {
    MeshSizingPolicy policy(default_length);
    const GeometryNode& root = model.root_node();
    add_defaults(policy, model, root, {});
    if (air) {
        policy.add_component("Air", model.extent(root).r_max * air->r_ratio / 20.0);
    }
    return policy;
}

}  // namespace magnetmesh
