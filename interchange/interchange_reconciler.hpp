#ifndef MAGNETMESH_INTERCHANGE_INTERCHANGE_RECONCILER_HPP
#define MAGNETMESH_INTERCHANGE_INTERCHANGE_RECONCILER_HPP

#include "interchange_document.hpp"
#include <kernel/kernel.hpp>
#include <naming/entity_lineage.hpp>
#include <naming/naming_registry.hpp>
#include <naming/physical_groups.hpp>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace magnetmesh {

struct ReconcileOptions {
    double tolerance = 1e-6;                    // on centroid distance and box corners
    std::set<std::string> required;             // groups whose loss aborts the run
    GroupingOptions grouping;
    // Channel<i> -> names of the groups it gathers
    std::map<std::string, std::vector<std::string>> channels;
    std::optional<std::size_t> expected_solids;
    bool is2D = false;
};

struct ReconcileResult {
    PhysicalGroupSet groups;
    NamingRegistry registry;
    EntityLineage lineage;
    int dim = 3;
    std::vector<std::string> resolved;
    std::vector<std::string> warnings;
};

// Matches the groups of an interchange document to the entities of a
// reimported model by nearest centroid. A group resolves only when every
// locator finds an entity within tolerance. Unresolved optional groups are
// reported as warnings; an unresolved required group raises
// GroupResolutionError.
class InterchangeReconciler {
public:
    explicit InterchangeReconciler(ReconcileOptions options);

    ReconcileResult reconcile(const Kernel& kernel, const InterchangeDocument& document) const;

private:
    ReconcileOptions options_;
};

// Isolating materials: names containing Isolant, Glue or Kapton
bool is_isolant_name(const std::string& name);

// Group name with a leading "Air_" removed
std::string strip_air_prefix(const std::string& name);

}  // namespace magnetmesh

#endif // MAGNETMESH_INTERCHANGE_INTERCHANGE_RECONCILER_HPP
