#include "field/scene_projector.hpp"

namespace vsfield {

const SpatialObject* SceneProjector::representative(const Square& square, Tick time, bool include_ghosts) const {
  const SpatialObject* best = nullptr;
  for (const auto& object : _grid.contents(square)) {
    if (!object.alive(time)) continue;
    if (object.is_ghost() && !include_ghosts) continue;
    // Later entries win ties.
    if (best == nullptr || object.time_created() >= best->time_created()) {
      best = &object;
    }
  }
  return best;
}

Environment SceneProjector::project(Tick time, bool include_ghosts, const std::string& name) const {
  Environment scene(name, _grid.width, _grid.height);
  for (GridCoord row = 0; row < _grid.height; row++) {
    for (GridCoord col = 0; col < _grid.width; col++) {
      const SpatialObject* shown = representative(Square(col, row), time, include_ghosts);
      if (shown == nullptr) continue;
      scene.add_item_to_square(col, row, shown->identifier(), shown->object_class());
    }
  }
  return scene;
}

}  // namespace vsfield
