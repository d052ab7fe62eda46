#ifndef PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_FIELD_MOVE_ENGINE_HPP_
#define PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_FIELD_MOVE_ENGINE_HPP_

#include <string>
#include <vector>

#include "config/field_config.hpp"
#include "core/spatial_grid.hpp"
#include "core/types.hpp"
#include "env/environment.hpp"
#include "systems/stats_tracker.hpp"

namespace vsfield {

// One position of an object along a move sequence.
struct MoveStep {
  std::string identifier;
  int col = 0;
  int row = 0;
};

// The object's current square followed by every square it passes through. Only the last one is recorded.
using MoveSequence = std::vector<MoveStep>;

struct MoveResult {
  Tick finish_time = 0;
  StatsTracker stats;
};

class MoveEngine {
public:
  MoveEngine(const FieldConfig& config, const Environment& reality) : _config(config), _reality(reality) {}

  // Throws IllegalMoveError describing the first problem found. Never touches the grid.
  void validate(const SpatialGrid& grid, const std::vector<MoveSequence>& moves, Tick requested_time) const;

  // Validates the whole batch, then applies it: objects leave their origins at requested_time + access time
  // and arrive at requested_time + access time + movement time.
  MoveResult apply(SpatialGrid& grid, const std::vector<MoveSequence>& moves, Tick requested_time) const;

private:
  void settle_origin(SpatialGrid& grid, const Square& origin, Tick removal_time) const;
  bool place(SpatialGrid& grid, const Square& destination, const SpatialObject& moved, Tick placement_time) const;

  FieldConfig _config;
  const Environment& _reality;
};

}  // namespace vsfield

#endif  // PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_FIELD_MOVE_ENGINE_HPP_
