#include "entity_lineage.hpp"

#include <common/logging.hpp>

#include <algorithm>
#include <cmath>

namespace magnetmesh {

namespace {

constexpr double MEASURE_TIE_TOLERANCE = 1e-9;

void push_unique(std::vector<NameId>& ids, NameId id) {
    if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
        ids.push_back(id);
    }
}

}  // namespace

EntityLineage::NameEntry& EntityLineage::entry(const SemanticName& name) {
    while (names_.size() <= name.id) {
        parent_.push_back(static_cast<NameId>(names_.size()));
        names_.emplace_back();
    }
    NameEntry& e = names_[name.id];
    e.path = name.path;
    e.padding = name.padding;
    e.bound = true;
    return e;
}

TagIndex EntityLineage::add_record(const DimTag& tag) {
    auto it = live_.find(tag);
    if (it != live_.end()) {
        return it->second;
    }
    discarded_.erase(tag);
    arena_.push_back({tag, generation_, std::nullopt});
    TagIndex index = static_cast<TagIndex>(arena_.size() - 1);
    live_[tag] = index;
    return index;
}

void EntityLineage::attach(NameId id, TagIndex index) {
    NameEntry& e = names_[id];
    for (const auto& b : e.bindings) {
        if (b.record == index && !b.to) return;
    }
    e.bindings.push_back({index, generation_, std::nullopt});
    push_unique(live_owners_[arena_[index].tag], id);
}

void EntityLineage::retire(const DimTag& tag) {
    auto it = live_.find(tag);
    if (it == live_.end()) return;
    arena_[it->second].retired = generation_;
    live_.erase(it);
    live_owners_.erase(tag);
}

void EntityLineage::bind(const SemanticName& name, const DimTags& tags) {
    NameEntry& e = entry(name);
    if (!tags.empty()) {
        e.consumed.reset();
    }
    for (const auto& tag : tags) {
        attach(name.id, add_record(tag));
    }
}

void EntityLineage::replace(const SemanticName& name, const DimTags& tags) {
    NameEntry& e = entry(name);
    ++generation_;
    for (auto& b : e.bindings) {
        if (b.to) continue;
        b.to = generation_;
        const DimTag tag = arena_[b.record].tag;
        auto owners = live_owners_.find(tag);
        if (owners == live_owners_.end()) continue;
        auto& ids = owners->second;
        ids.erase(std::remove(ids.begin(), ids.end(), name.id), ids.end());
        if (ids.empty()) {
            retire(tag);
        }
    }
    bind(name, tags);
}

void EntityLineage::discard(const DimTags& tags) {
    for (const auto& tag : tags) {
        retire(tag);
        discarded_.insert(tag);
    }
}

OperationRecord EntityLineage::record(BooleanOp op, const DimTags& objects, const DimTags& tools,
                                      bool remove_tool, const Kernel& kernel) const {
    OperationRecord rec;
    rec.op = op;
    rec.inputs = objects;
    rec.inputs.insert(rec.inputs.end(), tools.begin(), tools.end());
    rec.object_count = objects.size();
    rec.remove_tool = remove_tool;
    rec.measures.reserve(rec.inputs.size());
    for (const auto& tag : rec.inputs) {
        rec.measures.push_back(kernel.mass(tag));
    }
    return rec;
}

std::vector<NameId> EntityLineage::choose_owners(
    const OperationRecord& record, const std::vector<std::size_t>& contributors,
    const std::vector<std::vector<NameId>>& input_owners) {
    std::vector<NameId> candidates;
    for (std::size_t i : contributors) {
        for (NameId id : input_owners[i]) {
            push_unique(candidates, id);
        }
    }
    if (candidates.size() <= 1) {
        return candidates;
    }

    if (record.op == BooleanOp::Fuse) {
        // Larger operand keeps its name; equal measures keep the earlier registration
        std::map<NameId, double> measure;
        for (std::size_t i : contributors) {
            for (NameId id : input_owners[i]) {
                measure[id] += record.measures[i];
            }
        }
        NameId winner = candidates.front();
        for (NameId id : candidates) {
            double m = measure[id];
            double w = measure[winner];
            double tol = MEASURE_TIE_TOLERANCE * std::max(std::abs(m), std::abs(w));
            if (m > w + tol || (std::abs(m - w) <= tol && id < winner)) {
                winner = id;
            }
        }
        for (NameId id : candidates) {
            if (id != winner) {
                merge_into(winner, id);
            }
        }
        return {winner};
    }

    // Overlaps: physical names take precedence over padding
    std::vector<NameId> physical;
    for (NameId id : candidates) {
        if (!names_[id].padding) {
            physical.push_back(id);
        }
    }
    return physical.empty() ? candidates : physical;
}

void EntityLineage::rebind_after_operation(const OperationRecord& record,
                                           const BooleanResult& result) {
    auto log = logging::get_logger();
    ++generation_;

    const std::size_t n = record.inputs.size();
    std::vector<std::vector<NameId>> input_owners(n);
    std::vector<NameId> participants;
    // Names holding an input the operation does not remove
    std::vector<NameId> kept_inputs;
    for (std::size_t i = 0; i < n; ++i) {
        input_owners[i] = owners(record.inputs[i]);
        const bool removed_tool = i >= record.object_count && record.remove_tool;
        for (NameId id : input_owners[i]) {
            push_unique(participants, id);
            if (!removed_tool) push_unique(kept_inputs, id);
        }
    }

    std::map<DimTag, std::vector<std::size_t>> contributors;
    for (std::size_t i = 0; i < n && i < result.ancestry.size(); ++i) {
        for (const auto& child : result.ancestry[i]) {
            contributors[child].push_back(i);
        }
    }
    // Kept tools that the kernel did not report keep their identity
    for (std::size_t i = record.object_count; i < n; ++i) {
        bool reported = i < result.ancestry.size() && !result.ancestry[i].empty();
        if (!record.remove_tool && !reported) {
            contributors[record.inputs[i]].push_back(i);
        }
    }

    for (const auto& tag : record.inputs) {
        retire(tag);
    }

    std::size_t unowned = 0;
    for (const auto& [child, from] : contributors) {
        std::vector<NameId> chosen = choose_owners(record, from, input_owners);
        if (chosen.empty()) {
            ++unowned;
            continue;
        }
        TagIndex index = add_record(child);
        for (NameId id : chosen) {
            attach(id, index);
        }
    }

    for (NameId id : participants) {
        if (canonical(id) != id || !live_tags(id).empty()) continue;
        const bool tool_only =
            std::find(kept_inputs.begin(), kept_inputs.end(), id) == kept_inputs.end();
        if (tool_only) {
            names_[id].consumed = generation_ - 1;
            log->debug("Name '{}' consumed as a tool of {}", names_[id].path,
                       boolean_op_name(record.op));
        } else if (!names_[id].padding) {
            log->warn("Name '{}' lost all its entities in {}", names_[id].path,
                      boolean_op_name(record.op));
        }
    }
    log->debug("Lineage generation {}: {} {} inputs -> {} outputs ({} unowned)",
               generation_, boolean_op_name(record.op), n, contributors.size(), unowned);
}

void EntityLineage::rebind_mapped(const DimTags& inputs, const std::vector<DimTags>& ancestry) {
    ++generation_;
    std::vector<std::vector<NameId>> input_owners;
    for (const auto& tag : inputs) {
        input_owners.push_back(owners(tag));
    }
    for (const auto& tag : inputs) {
        retire(tag);
    }
    for (std::size_t i = 0; i < inputs.size() && i < ancestry.size(); ++i) {
        for (const auto& child : ancestry[i]) {
            TagIndex index = add_record(child);
            for (NameId id : input_owners[i]) {
                attach(id, index);
            }
        }
    }
}

NameId EntityLineage::find_root(NameId id) const {
    while (id < parent_.size() && parent_[id] != id) {
        id = parent_[id];
    }
    return id;
}

NameId EntityLineage::canonical(NameId id) const {
    return find_root(id);
}

void EntityLineage::merge_into(NameId survivor, NameId merged) {
    NameId root_survivor = find_root(survivor);
    NameId root_merged = find_root(merged);
    if (root_survivor == root_merged) return;
    parent_[root_merged] = root_survivor;
    merges_.push_back({root_survivor, root_merged, generation_});
    logging::get_logger()->info("Fuse collapsed '{}' into '{}'", names_[root_merged].path,
                                names_[root_survivor].path);
}

std::vector<NameId> EntityLineage::owners(const DimTag& tag) const {
    std::vector<NameId> result;
    auto it = live_owners_.find(tag);
    if (it == live_owners_.end()) return result;
    for (NameId id : it->second) {
        push_unique(result, canonical(id));
    }
    return result;
}

bool EntityLineage::is_bound(NameId id) const {
    return id < names_.size() && names_[id].bound;
}

DimTags EntityLineage::live_tags(NameId root) const {
    std::set<DimTag> tags;
    for (NameId n = 0; n < names_.size(); ++n) {
        if (!names_[n].bound || find_root(n) != root) continue;
        for (const auto& b : names_[n].bindings) {
            const TagRecord& rec = arena_[b.record];
            if (!b.to && !rec.retired) {
                tags.insert(rec.tag);
            }
        }
    }
    return DimTags(tags.begin(), tags.end());
}

DimTags EntityLineage::resolve(NameId id) const {
    const NameId root = find_root(id);
    DimTags tags = live_tags(root);
    if (tags.empty()) {
        if (auto last = consumed_at(root)) {
            return resolve_at(root, *last);
        }
    }
    return tags;
}

std::optional<Generation> EntityLineage::consumed_at(NameId id) const {
    const NameId root = find_root(id);
    if (root >= names_.size()) return std::nullopt;
    return names_[root].consumed;
}

DimTags EntityLineage::resolve_at(NameId id, Generation generation) const {
    std::set<DimTag> tags;
    if (id >= names_.size()) return {};
    for (const auto& b : names_[id].bindings) {
        const TagRecord& rec = arena_[b.record];
        bool bound = b.from <= generation && (!b.to || *b.to > generation);
        if (bound && rec.live_at(generation)) {
            tags.insert(rec.tag);
        }
    }
    return DimTags(tags.begin(), tags.end());
}

DimTags EntityLineage::unresolved(const DimTags& entities) const {
    DimTags result;
    for (const auto& tag : entities) {
        if (discarded_.count(tag)) continue;
        auto it = live_owners_.find(tag);
        if (it == live_owners_.end() || it->second.empty()) {
            result.push_back(tag);
        }
    }
    return result;
}

}  // namespace magnetmesh
