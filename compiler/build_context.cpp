#include "build_context.hpp"

#include <set>

namespace magnetmesh {

const SemanticName& BuildContext::add_solid(const std::vector<std::string>& path,
                                            Category category, int surface, bool indexed) {
    const SemanticName& name = indexed ? registry.register_indexed(path, category, 2)
                                       : registry.register_name(path, category, 2);
    lineage.bind(name, {{2, surface}});
    solids.push_back(name.id);
    return name;
}

DimTags BuildContext::solid_tags() const {
    std::set<DimTag> tags;
    for (NameId id : solids) {
        for (const auto& t : lineage.resolve(id)) {
            tags.insert(t);
        }
    }
    return DimTags(tags.begin(), tags.end());
}

BooleanResult run_boolean(BuildContext& ctx, BooleanOp op, const DimTags& objects,
                          const DimTags& tools, bool remove_tool) {
    Kernel& k = ctx.kernel();
    OperationRecord rec = ctx.lineage.record(op, objects, tools, remove_tool, k);
    BooleanResult result = k.boolean(op, objects, tools, remove_tool);
    k.synchronize();
    ctx.lineage.rebind_after_operation(rec, result);
    return result;
}

std::vector<std::string> child_path(const std::vector<std::string>& prefix,
                                    const std::string& segment) {
    std::vector<std::string> path = prefix;
    path.push_back(segment);
    return path;
}

}  // namespace magnetmesh
