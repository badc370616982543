#ifndef MAGNETMESH_KERNEL_MESH_HPP
#define MAGNETMESH_KERNEL_MESH_HPP

#include <math/bounding_box.hpp>
#include <math/vec3.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace magnetmesh {

struct MeshNode {
    std::size_t tag = 0;
    Vec3 position;
};

struct MeshElement {
    std::size_t tag = 0;
    int type = 0;                      // kernel element type code
    int entity_dim = 0;
    int entity_tag = 0;
    std::vector<std::size_t> nodes;
};

struct MeshGroup {
    int dim = 0;
    int tag = 0;
    std::string name;
    std::vector<int> entities;
};

// Generated mesh as read back from the kernel: nodes, connectivity and
// physical group membership
struct Mesh {
    std::string name;
    std::vector<MeshNode> nodes;
    std::vector<MeshElement> elements;
    std::vector<MeshGroup> groups;

    const MeshGroup* find_group(const std::string& group_name) const;
    const MeshNode* find_node(std::size_t tag) const;

    // Box around the nodes of every element that belongs to the group
    std::optional<BoundingBox> group_bounding_box(const std::string& group_name) const;
};

// Concatenates meshes; entity and group tags of mesh i are offset by
// 1000 * i and group names get a "_<i>" suffix
Mesh merge_meshes(const std::vector<Mesh>& meshes, const std::string& name);

}  // namespace magnetmesh

#endif // MAGNETMESH_KERNEL_MESH_HPP
