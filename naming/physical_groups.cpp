#include "physical_groups.hpp"

#include <common/logging.hpp>

#include <algorithm>
#include <cctype>
#include <map>
#include <set>

namespace magnetmesh {

void PhysicalGroupSet::add(const std::string& name, Category category, int dim,
                           const std::vector<int>& tags) {
    auto it = std::find_if(groups_.begin(), groups_.end(), [&](const PhysicalGroup& g) {
        return g.name == name && g.dim == dim;
    });
    if (it == groups_.end()) {
        groups_.push_back({name, category, dim, {}});
        it = std::prev(groups_.end());
    }
    std::set<int> merged(it->tags.begin(), it->tags.end());
    merged.insert(tags.begin(), tags.end());
    it->tags.assign(merged.begin(), merged.end());
}

std::vector<const PhysicalGroup*> PhysicalGroupSet::by_category(Category category) const {
    std::vector<const PhysicalGroup*> result;
    for (const auto& group : groups_) {
        if (group.category == category) {
            result.push_back(&group);
        }
    }
    return result;
}

std::size_t PhysicalGroupSet::count(Category category) const {
    return by_category(category).size();
}

const PhysicalGroup* PhysicalGroupSet::find(const std::string& name) const {
    for (const auto& group : groups_) {
        if (group.name == name) return &group;
    }
    return nullptr;
}

const PhysicalGroup* PhysicalGroupSet::find(const std::string& name, int dim) const {
    for (const auto& group : groups_) {
        if (group.name == name && group.dim == dim) return &group;
    }
    return nullptr;
}

std::string strip_index(const std::string& name) {
    std::size_t end = name.size();
    while (end > 0 && std::isdigit(static_cast<unsigned char>(name[end - 1]))) {
        --end;
    }
    return end == 0 ? name : name.substr(0, end);
}

PhysicalGroupSet flatten(const NamingRegistry& registry, const EntityLineage& lineage,
                         const GroupingOptions& options) {
    auto log = logging::get_logger();
    PhysicalGroupSet result;

    for (const auto& name : registry.names()) {
        if (!lineage.is_bound(name.id) || lineage.canonical(name.id) != name.id) {
            continue;
        }
        if (name.category == Category::Isolant && options.hide_isolants) {
            continue;
        }
        // Nothing left in the model to tag
        if (lineage.consumed(name.id)) {
            log->debug("'{}' was consumed by a boolean, group skipped", name.path);
            continue;
        }
        DimTags tags = lineage.resolve(name.id);
        if (tags.empty()) {
            log->warn("No entity left for '{}', group skipped", name.path);
            continue;
        }

        std::map<int, std::vector<int>> by_dim;
        for (const auto& t : tags) {
            by_dim[t.dim].push_back(t.tag);
        }
        std::string group_name = name.path;
        if ((name.category == Category::Isolant && options.group_isolants) ||
            (name.category == Category::Channel && options.group_channels)) {
            group_name = strip_index(group_name);
        }
        for (const auto& [dim, dim_tags] : by_dim) {
            result.add(group_name, name.category, dim, dim_tags);
        }
    }
    log->debug("Flattened {} names into {} physical groups", registry.size(), result.size());
    return result;
}

void apply(Kernel& kernel, const PhysicalGroupSet& groups) {
    for (const auto& group : groups.groups()) {
        kernel.add_physical_group(group.dim, group.tags, group.name);
    }
}

}  // namespace magnetmesh
