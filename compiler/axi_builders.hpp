#ifndef MAGNETMESH_COMPILER_AXI_BUILDERS_HPP
#define MAGNETMESH_COMPILER_AXI_BUILDERS_HPP

#include "build_context.hpp"
#include <model/geometry_model.hpp>

#include <string>
#include <vector>

namespace magnetmesh {

// Profile builders in the (r, z) half plane. Each one registers the solids
// and boundaries of its node under the given path prefix.
void build_bitter(BuildContext& ctx, const Bitter& bitter, const std::vector<std::string>& prefix);
void build_helix(BuildContext& ctx, const Helix& helix, const std::vector<std::string>& prefix);
void build_ring(BuildContext& ctx, const Insert& insert, std::size_t index,
                const std::vector<std::string>& prefix);
void build_insert(BuildContext& ctx, const Insert& insert, const std::vector<std::string>& prefix);
void build_supra(BuildContext& ctx, const Supra& supra, const std::vector<std::string>& prefix);
void build_screen(BuildContext& ctx, const Screen& screen, const std::vector<std::string>& prefix);
void build_site(BuildContext& ctx, const MSite& site, const std::vector<std::string>& prefix);

// Dispatches on the node kind
void build_node(BuildContext& ctx, const GeometryNode& node, const std::vector<std::string>& prefix);

}  // namespace magnetmesh

#endif // MAGNETMESH_COMPILER_AXI_BUILDERS_HPP
