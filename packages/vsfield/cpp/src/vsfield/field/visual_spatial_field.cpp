#include "field/visual_spatial_field.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "core/errors.hpp"
#include "field/field_constructor.hpp"
#include "field/scene_projector.hpp"
#include "util/log.hpp"

namespace vsfield {

AttentionClock* VisualSpatialField::require_clock(AttentionClock* clock) {
  if (clock == nullptr) {
    throw ConstructionError("attention clock cannot be null");
  }
  return clock;
}

VisualSpatialField::VisualSpatialField(const Environment& reality,
                                       const FieldConfig& config,
                                       Tick creation_time,
                                       AttentionClock* clock,
                                       RecognitionSource& recognition,
                                       FixationSource& fixations,
                                       ShortTermMemory* short_term_memory)
    : _reality(reality),
      _config(config),
      _creation_time(creation_time),
      _clock(require_clock(clock)),
      _grid(nullptr),
      _move_engine(_config, _reality),
      _stats() {
  _config.validate();
  if (!_clock->is_free_at(creation_time)) {
    throw ConstructionError("Cannot construct a visual-spatial field at " + std::to_string(creation_time) +
                            ", attention is busy until " + std::to_string(_clock->time()));
  }

  FieldConstructor constructor(_config, recognition, fixations);
  ConstructionResult result = constructor.build(_reality, creation_time);

  _grid = std::move(result.grid);
  if (short_term_memory != nullptr) {
    for (const auto& chunk : result.recognised) {
      short_term_memory->push(chunk, result.recognition_time);
    }
  }
  _clock->advance_to(result.finish_time);
  _stats.merge(result.stats);
}

VisualSpatialField::~VisualSpatialField() = default;

void VisualSpatialField::move_objects(const std::vector<MoveSequence>& moves, Tick requested_time) {
  try {
    _clock->check_free_at(requested_time);
    MoveResult result = _move_engine.apply(*_grid, moves, requested_time);
    _clock->advance_to(result.finish_time);
    _stats.merge(result.stats);
  } catch (const FieldError& e) {
    logger()->debug("Move batch requested at {} rejected: {}", requested_time, e.what());
    throw;
  }
}

Square VisualSpatialField::checked_square(int col, int row) const {
  if (!_grid->is_valid_square(col, row)) {
    throw std::out_of_range("Square (" + std::to_string(col) + ", " + std::to_string(row) +
                            ") is outside the visual-spatial field");
  }
  return Square(static_cast<GridCoord>(col), static_cast<GridCoord>(row));
}

const CellHistory& VisualSpatialField::square_contents(int col, int row) const {
  return _grid->contents(checked_square(col, row));
}

std::vector<SpatialObject> VisualSpatialField::square_contents_at(int col, int row, Tick time) const {
  std::vector<SpatialObject> alive;
  for (const SpatialObject* object : _grid->alive_at(checked_square(col, row), time)) {
    alive.push_back(*object);
  }
  return alive;
}

Environment VisualSpatialField::as_scene(Tick time, bool include_ghosts) const {
  return SceneProjector(*_grid).project(time, include_ghosts, _reality.name() + "@" + std::to_string(time));
}

}  // namespace vsfield
