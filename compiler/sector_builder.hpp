#ifndef MAGNETMESH_COMPILER_SECTOR_BUILDER_HPP
#define MAGNETMESH_COMPILER_SECTOR_BUILDER_HPP

#include "build_context.hpp"
#include <model/geometry_model.hpp>

#include <string>
#include <vector>

namespace magnetmesh {

// Planar (x, y) sector of a Bitter plate between two tie rods, with tie rod
// and cooling slit holes cut out. The sector spans [-180/n, 180/n] degrees
// for n tie rods. Boundaries are resolved as soon as the cut is done.
void build_sector(BuildContext& ctx, const Bitter& bitter, const std::vector<std::string>& prefix);

}  // namespace magnetmesh

#endif // MAGNETMESH_COMPILER_SECTOR_BUILDER_HPP
