#ifndef PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_FIELD_VISUAL_SPATIAL_FIELD_HPP_
#define PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_FIELD_VISUAL_SPATIAL_FIELD_HPP_

#include <memory>
#include <vector>

#include "config/field_config.hpp"
#include "core/attention_clock.hpp"
#include "core/spatial_grid.hpp"
#include "core/types.hpp"
#include "env/environment.hpp"
#include "field/move_engine.hpp"
#include "recognition/oracles.hpp"
#include "systems/stats_tracker.hpp"

namespace vsfield {

// A time-stamped memory of a scanned scene whose objects can be moved mentally.
//
// Constructing a field scans `reality` and occupies attention; construction either succeeds completely or
// throws (ConstructionError, DuplicateObjectError) leaving the clock and the short-term memory untouched.
// The clock is borrowed and must outlive the field.
class VisualSpatialField {
public:
  VisualSpatialField(const Environment& reality,
                     const FieldConfig& config,
                     Tick creation_time,
                     AttentionClock* clock,
                     RecognitionSource& recognition,
                     FixationSource& fixations,
                     ShortTermMemory* short_term_memory = nullptr);
  ~VisualSpatialField();

  VisualSpatialField(const VisualSpatialField&) = delete;
  VisualSpatialField& operator=(const VisualSpatialField&) = delete;

  // Throws AttentionBusyError or IllegalMoveError; the field and clock are unchanged when it does.
  void move_objects(const std::vector<MoveSequence>& moves, Tick requested_time);

  // Full history of the square, oldest first.
  const CellHistory& square_contents(int col, int row) const;
  // Copies of the objects alive on the square at `time`; unaffected by later moves.
  std::vector<SpatialObject> square_contents_at(int col, int row, Tick time) const;

  Environment as_scene(Tick time, bool include_ghosts) const;

  Tick attention_clock() const {
    return _clock->time();
  }

  GridCoord width() const {
    return _grid->width;
  }

  GridCoord height() const {
    return _grid->height;
  }

  Tick creation_time() const {
    return _creation_time;
  }

  const Environment& scene_encoded() const {
    return _reality;
  }

  const FieldConfig& config() const {
    return _config;
  }

  const SpatialGrid& grid() const {
    return *_grid;
  }

  const StatsTracker& stats() const {
    return _stats;
  }

private:
  static AttentionClock* require_clock(AttentionClock* clock);
  Square checked_square(int col, int row) const;

  Environment _reality;
  FieldConfig _config;
  Tick _creation_time;
  AttentionClock* _clock;
  std::unique_ptr<SpatialGrid> _grid;
  MoveEngine _move_engine;
  StatsTracker _stats;
};

}  // namespace vsfield

#endif  // PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_FIELD_VISUAL_SPATIAL_FIELD_HPP_
