#include "field/move_engine.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <unordered_set>

#include "core/errors.hpp"
#include "util/log.hpp"

namespace vsfield {

namespace {

std::string describe(const MoveStep& step) {
  return "'" + step.identifier + "' at (" + std::to_string(step.col) + ", " + std::to_string(step.row) + ")";
}

Square square_of(const MoveStep& step) {
  return Square(static_cast<GridCoord>(step.col), static_cast<GridCoord>(step.row));
}

}  // namespace

void MoveEngine::validate(const SpatialGrid& grid, const std::vector<MoveSequence>& moves, Tick requested_time) const {
  if (moves.empty()) {
    throw IllegalMoveError("No move sequences given");
  }

  std::unordered_set<std::string> moving;
  for (size_t i = 0; i < moves.size(); i++) {
    const MoveSequence& sequence = moves[i];
    if (sequence.size() < 2) {
      throw IllegalMoveError("Move sequence " + std::to_string(i) +
                             " must give the object's location and at least one destination");
    }

    const std::string& identifier = sequence.front().identifier;
    for (const auto& step : sequence) {
      if (step.identifier != identifier) {
        throw IllegalMoveError("Move sequence " + std::to_string(i) + " moves " + describe(step) +
                               " but started with '" + identifier + "'; sequences must move one object serially");
      }
      if (!grid.is_valid_square(step.col, step.row)) {
        throw IllegalMoveError("Move sequence " + std::to_string(i) + " leaves the field: " + describe(step));
      }
    }

    const SpatialObject* object = grid.find_alive(square_of(sequence.front()), identifier, requested_time);
    if (object == nullptr) {
      throw IllegalMoveError("No " + describe(sequence.front()) + " at time " + std::to_string(requested_time));
    }
    if (object->is_placeholder() || object->is_creator()) {
      throw IllegalMoveError(describe(sequence.front()) + " cannot be moved");
    }
    if (!moving.insert(identifier).second) {
      throw IllegalMoveError("'" + identifier + "' is moved by more than one sequence");
    }
  }
}

MoveResult MoveEngine::apply(SpatialGrid& grid, const std::vector<MoveSequence>& moves, Tick requested_time) const {
  validate(grid, moves, requested_time);

  Tick removal_time = requested_time + _config.access_time;
  Tick placement_time = removal_time + _config.object_movement_time;

  MoveResult result;
  std::vector<SpatialObject> moved;
  std::vector<Square> origins;

  for (const auto& sequence : moves) {
    Square origin = square_of(sequence.front());
    SpatialObject* object = grid.find_alive(origin, sequence.front().identifier, requested_time);
    moved.push_back(*object);
    // An object already decaying before removal keeps its earlier terminus.
    std::optional<Tick> terminus = object->terminus();
    object->set_terminus(terminus.has_value() ? std::min(*terminus, removal_time) : removal_time);
    if (std::find(origins.begin(), origins.end(), origin) == origins.end()) {
      origins.push_back(origin);
    }
  }

  for (const auto& origin : origins) {
    settle_origin(grid, origin, removal_time);
  }

  for (size_t i = 0; i < moves.size(); i++) {
    if (!place(grid, square_of(moves[i].back()), moved[i], placement_time)) {
      result.stats.incr("moves.left_field");
    }
  }

  result.stats.incr("moves.batches");
  result.stats.add("moves.sequences", static_cast<int64_t>(moves.size()));
  result.finish_time = placement_time;

  logger()->info(
      "Moved {} objects, requested at {}, attention free at {}", moves.size(), requested_time, placement_time);
  return result;
}

// Objects left behind on the origin are refreshed; an origin left with nothing alive gets a placeholder.
void MoveEngine::settle_origin(SpatialGrid& grid, const Square& origin, Tick removal_time) const {
  bool occupied = false;
  for (auto& object : grid.mutable_contents(origin)) {
    if (!object.alive(removal_time)) continue;
    occupied = true;
    if (object.is_creator() || object.is_placeholder()) continue;
    object.extend_terminus(removal_time + _config.unrecognised_object_lifespan);
  }
  if (occupied) return;

  if (_reality.is_blind(origin.col, origin.row)) {
    grid.add_object(origin, SpatialObject::blind(removal_time));
  } else {
    Tick terminus = removal_time + _config.unrecognised_object_lifespan;
    grid.add_object(origin, SpatialObject::empty(kEmptySquareToken, removal_time, terminus));
  }
}

// Returns false when the destination cannot be seen, in which case the object is no longer in the field.
bool MoveEngine::place(SpatialGrid& grid,
                       const Square& destination,
                       const SpatialObject& moved,
                       Tick placement_time) const {
  if (_reality.is_blind(destination.col, destination.row)) {
    logger()->debug("'{}' moved onto blind square ({}, {})", moved.identifier(), destination.col, destination.row);
    return false;
  }

  Tick terminus = placement_time + _config.unrecognised_object_lifespan;
  for (auto& object : grid.mutable_contents(destination)) {
    if (!object.alive(placement_time) || object.is_creator()) continue;
    if (object.is_placeholder()) {
      object.set_terminus(placement_time);
    } else {
      object.extend_terminus(terminus);
    }
  }

  grid.add_object(
      destination,
      SpatialObject(moved.identifier(), moved.object_class(), placement_time, terminus, false, moved.is_ghost()));
  return true;
}

}  // namespace vsfield
