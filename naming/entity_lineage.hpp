#ifndef MAGNETMESH_NAMING_ENTITY_LINEAGE_HPP
#define MAGNETMESH_NAMING_ENTITY_LINEAGE_HPP

#include "naming_registry.hpp"
#include <kernel/kernel.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace magnetmesh {

using TagIndex = uint32_t;
using Generation = uint32_t;

// One kernel entity as seen between two boolean operations
struct TagRecord {
    DimTag tag;
    Generation born = 0;
    std::optional<Generation> retired;

    bool live_at(Generation g) const {
        return born <= g && (!retired || *retired > g);
    }
};

// Snapshot of the inputs of a boolean, taken before the kernel runs it
struct OperationRecord {
    BooleanOp op = BooleanOp::Fragment;
    DimTags inputs;                 // objects then tools
    std::size_t object_count = 0;
    bool remove_tool = true;
    std::vector<double> measures;   // kernel mass of each input
};

// A fuse that collapsed one name into another
struct LineageMerge {
    NameId survivor = 0;
    NameId merged = 0;
    Generation generation = 0;
};

// Maps semantic names to kernel tags across booleans. Tags live in an arena
// indexed by generation; names hold arena indices so earlier lookups stay
// answerable after splits and merges. Names collapsed by a fuse are joined
// in a union-find and resolve to the survivor's tags. A name whose entities
// were all removed as boolean tools is consumed: it resolves to the tags it
// held just before, which no longer exist in the kernel model.
class EntityLineage {
public:
    void bind(const SemanticName& name, const DimTags& tags);
    // Retires the current tags of the name and binds new ones
    void replace(const SemanticName& name, const DimTags& tags);
    // Marks entities dropped on purpose, such as boolean tools, so they are
    // not reported as unresolved
    void discard(const DimTags& tags);

    OperationRecord record(BooleanOp op, const DimTags& objects, const DimTags& tools,
                           bool remove_tool, const Kernel& kernel) const;
    void rebind_after_operation(const OperationRecord& record, const BooleanResult& result);
    // One-parent mapping such as a revolution: children of inputs[i] inherit its owners
    void rebind_mapped(const DimTags& inputs, const std::vector<DimTags>& ancestry);

    DimTags resolve(NameId id) const;
    DimTags resolve(const SemanticName& name) const { return resolve(name.id); }
    DimTags resolve_at(NameId id, Generation generation) const;
    // Generation at which a consumed name was last live
    std::optional<Generation> consumed_at(NameId id) const;
    bool consumed(NameId id) const { return consumed_at(id).has_value(); }

    NameId canonical(NameId id) const;
    std::vector<NameId> owners(const DimTag& tag) const;
    bool is_bound(NameId id) const;

    // Entities of the list that no live name reaches and that were not discarded
    DimTags unresolved(const DimTags& entities) const;

    Generation generation() const { return generation_; }
    const std::vector<LineageMerge>& merges() const { return merges_; }
    const std::vector<TagRecord>& arena() const { return arena_; }
    const std::set<DimTag>& discarded() const { return discarded_; }

private:
    // Membership of one arena record in one name, over a span of generations
    struct Binding {
        TagIndex record = 0;
        Generation from = 0;
        std::optional<Generation> to;
    };

    struct NameEntry {
        std::string path;
        bool padding = false;
        bool bound = false;
        std::optional<Generation> consumed;
        std::vector<Binding> bindings;
    };

    NameEntry& entry(const SemanticName& name);
    TagIndex add_record(const DimTag& tag);
    void attach(NameId id, TagIndex index);
    void retire(const DimTag& tag);
    DimTags live_tags(NameId root) const;
    NameId find_root(NameId id) const;
    void merge_into(NameId survivor, NameId merged);
    std::vector<NameId> choose_owners(const OperationRecord& record,
                                      const std::vector<std::size_t>& contributors,
                                      const std::vector<std::vector<NameId>>& input_owners);

    std::vector<TagRecord> arena_;
    std::vector<NameEntry> names_;
    std::vector<NameId> parent_;
    std::map<DimTag, TagIndex> live_;
    std::map<DimTag, std::vector<NameId>> live_owners_;
    std::set<DimTag> discarded_;
    std::vector<LineageMerge> merges_;
    Generation generation_ = 0;
};

}  // namespace magnetmesh

#endif // MAGNETMESH_NAMING_ENTITY_LINEAGE_HPP
