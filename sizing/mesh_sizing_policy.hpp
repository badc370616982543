#ifndef MAGNETMESH_SIZING_MESH_SIZING_POLICY_HPP
#define MAGNETMESH_SIZING_MESH_SIZING_POLICY_HPP

#include <compiler/compile_options.hpp>
#include <model/geometry_model.hpp>

#include <optional>
#include <string>
#include <vector>

namespace magnetmesh {

enum class SizingScope { Global, Component, Surface };

std::string scope_name(SizingScope scope);

// Target element length for one scope. target is a component path for
// Component rules and unused otherwise.
struct SizingRule {
    SizingScope scope = SizingScope::Global;
    std::string target;
    int surface = 0;
    double length = 0.0;
};

// Resolves target element lengths from layered rules:
// surface rule > longest matching component path > global rule > default.
// Within one specificity the last registered rule wins. Lengths are checked
// at registration so resolution never fails.
class MeshSizingPolicy {
public:
    explicit MeshSizingPolicy(double default_length);

    void add_rule(const SizingRule& rule);
    void add_global(double length);
    void add_component(const std::string& path, double length);
    void add_surface(int surface, double length);

    double resolve(int surface, const std::string& component_path) const;

    double default_length() const { return default_length_; }
    const std::vector<SizingRule>& rules() const { return rules_; }

    // Rules derived from the magnet dimensions: helix width / 3, ring
    // width / 10, Bitter and Supra width / 5, air radius / 20
    static MeshSizingPolicy from_model(const GeometryModel& model,
                                       const std::optional<AirOptions>& air,
                                       double default_length);

private:
    double default_length_;
    std::vector<SizingRule> rules_;
};

// Whether path names the component or one of its descendants
bool path_matches(const std::string& prefix, const std::string& path);

}  // namespace magnetmesh

#endif // MAGNETMESH_SIZING_MESH_SIZING_POLICY_HPP
