#ifndef PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_FIELD_SCENE_PROJECTOR_HPP_
#define PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_FIELD_SCENE_PROJECTOR_HPP_

#include <string>

#include "core/spatial_grid.hpp"
#include "core/types.hpp"
#include "env/environment.hpp"

namespace vsfield {

// Read-only view rendering a SpatialGrid at one instant.
class SceneProjector {
public:
  explicit SceneProjector(const SpatialGrid& grid) : _grid(grid) {}

  // Each square shows its most recently created alive object (ghosts only if asked); squares with nothing
  // alive show as blind.
  Environment project(Tick time, bool include_ghosts, const std::string& name) const;

  const SpatialObject* representative(const Square& square, Tick time, bool include_ghosts) const;

private:
  const SpatialGrid& _grid;
};

}  // namespace vsfield

#endif  // PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_FIELD_SCENE_PROJECTOR_HPP_
