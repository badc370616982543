#include "mesh.hpp"

#include <algorithm>
#include <set>
#include <unordered_map>
#include <utility>

namespace magnetmesh {

const MeshGroup* Mesh::find_group(const std::string& group_name) const {
    for (const auto& group : groups) {
        if (group.name == group_name) {
            return &group;
        }
    }
    return nullptr;
}

const MeshNode* Mesh::find_node(std::size_t tag) const {
    auto it = std::find_if(nodes.begin(), nodes.end(),
                           [tag](const MeshNode& n) { return n.tag == tag; });
    return it == nodes.end() ? nullptr : &*it;
}

std::optional<BoundingBox> Mesh::group_bounding_box(const std::string& group_name) const {
    const MeshGroup* group = find_group(group_name);
    if (!group) {
        return std::nullopt;
    }
    std::set<int> members(group->entities.begin(), group->entities.end());

    std::unordered_map<std::size_t, const MeshNode*> by_tag;
    for (const auto& node : nodes) {
        by_tag[node.tag] = &node;
    }

    BoundingBox box;
    for (const auto& element : elements) {
        if (element.entity_dim != group->dim || !members.count(element.entity_tag)) {
            continue;
        }
        for (std::size_t node_tag : element.nodes) {
            auto it = by_tag.find(node_tag);
            if (it != by_tag.end()) {
                box.expand(it->second->position);
            }
        }
    }
    if (box.empty()) {
        return std::nullopt;
    }
    return box;
}

Mesh merge_meshes(const std::vector<Mesh>& meshes, const std::string& name) {
    Mesh merged;
    merged.name = name;
    std::size_t node_offset = 0;
    std::size_t element_offset = 0;

    for (std::size_t i = 0; i < meshes.size(); ++i) {
        const Mesh& mesh = meshes[i];
        const int entity_offset = static_cast<int>(1000 * i);
        std::size_t max_node = 0;
        std::size_t max_element = 0;

        for (const auto& node : mesh.nodes) {
            merged.nodes.push_back({node.tag + node_offset, node.position});
            max_node = std::max(max_node, node.tag);
        }
        for (const auto& element : mesh.elements) {
            MeshElement copy = element;
            copy.tag += element_offset;
            copy.entity_tag += entity_offset;
            for (auto& n : copy.nodes) {
                n += node_offset;
            }
            merged.elements.push_back(std::move(copy));
            max_element = std::max(max_element, element.tag);
        }
        for (const auto& group : mesh.groups) {
            MeshGroup copy = group;
            copy.tag += entity_offset;
            copy.name += "_" + std::to_string(i);
            for (auto& e : copy.entities) {
                e += entity_offset;
            }
            merged.groups.push_back(std::move(copy));
        }
        node_offset += max_node;
        element_offset += max_element;
    }
    return merged;
}

}  // namespace magnetmesh
