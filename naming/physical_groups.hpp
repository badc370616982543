#ifndef MAGNETMESH_NAMING_PHYSICAL_GROUPS_HPP
#define MAGNETMESH_NAMING_PHYSICAL_GROUPS_HPP

#include "entity_lineage.hpp"
#include "naming_registry.hpp"
#include <kernel/kernel.hpp>

#include <string>
#include <vector>

namespace magnetmesh {

struct PhysicalGroup {
    std::string name;
    Category category = Category::Conductor;
    int dim = 2;
    std::vector<int> tags;   // ascending
};

struct GroupingOptions {
    bool hide_isolants = false;   // drop isolant groups
    bool group_isolants = false;  // isolants sharing a stem share one group
    bool group_channels = false;  // same for channels
};

class PhysicalGroupSet {
public:
    // Adds tags to the group (name, dim), creating it on first use
    void add(const std::string& name, Category category, int dim, const std::vector<int>& tags);

    const std::vector<PhysicalGroup>& groups() const { return groups_; }
    std::vector<const PhysicalGroup*> by_category(Category category) const;
    std::size_t count(Category category) const;
    const PhysicalGroup* find(const std::string& name) const;
    const PhysicalGroup* find(const std::string& name, int dim) const;
    bool empty() const { return groups_.empty(); }
    std::size_t size() const { return groups_.size(); }

private:
    std::vector<PhysicalGroup> groups_;
};

// Name with trailing digits removed: "S1_I3" -> "S1_I"
std::string strip_index(const std::string& name);

// Builds one group per surviving name and dimension
PhysicalGroupSet flatten(const NamingRegistry& registry, const EntityLineage& lineage,
                         const GroupingOptions& options = {});

// Creates the groups in the kernel model
void apply(Kernel& kernel, const PhysicalGroupSet& groups);

}  // namespace magnetmesh

#endif // MAGNETMESH_NAMING_PHYSICAL_GROUPS_HPP
