#include "field/field_constructor.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "core/errors.hpp"
#include "recognition/fixation_pattern.hpp"
#include "util/log.hpp"

namespace vsfield {

// Running state of one build() call.
struct FieldConstructor::Pass {
  struct GhostRecord {
    std::string identifier;
    Square square;
  };

  SpatialGrid& grid;
  const Environment& reality;
  StatsTracker& stats;
  Tick time;
  // Squares already holding a recognised real object; the raster pass leaves them alone.
  std::vector<std::vector<bool>> finalised;
  std::unordered_map<EntryId, GhostRecord> ghosts;
  uint64_t next_ghost = 0;
};

ConstructionResult FieldConstructor::build(const Environment& reality, Tick start_time) {
  _config.validate();

  ConstructionResult result;
  if (reality.is_entirely_blind()) {
    logger()->info("Scene '{}' is entirely blind, nothing to encode", reality.name());
    result.grid = std::make_unique<SpatialGrid>(0, 0);
    result.finish_time = start_time;
    result.recognition_time = start_time;
    return result;
  }

  auto grid = std::make_unique<SpatialGrid>(reality.width(), reality.height());
  Tick access_time = start_time + _config.access_time;
  Pass pass{*grid,
            reality,
            result.stats,
            access_time,
            std::vector<std::vector<bool>>(reality.height(), std::vector<bool>(reality.width(), false)),
            {},
            0};

  // The creator's avatar is placed on access at no cost and owns its square.
  for (GridCoord row = 0; row < reality.height(); row++) {
    for (GridCoord col = 0; col < reality.width(); col++) {
      const SceneObject& real = reality.square_contents(col, row);
      if (_config.encode_scene_creator && real.object_class == kCreatorToken) {
        grid->add_object(Square(col, row),
                         SpatialObject(real.identifier, real.object_class, access_time, std::nullopt, false, false));
        pass.finalised[row][col] = true;
        result.stats.incr("construction.creator_encoded");
      } else {
        grid->add_object(Square(col, row), SpatialObject::blind(access_time));
      }
    }
  }

  for (const auto& chunk : scan(reality, access_time, result)) {
    for (const auto& entry : chunk.image) {
      encode_entry(pass, entry);
    }
  }
  raster_pass(pass);

  grid->check_for_duplicate_objects();

  logger()->info("Encoded scene '{}' ({}x{}) from {} to {}: {} chunks, {} objects",
                 reality.name(),
                 reality.width(),
                 reality.height(),
                 start_time,
                 pass.time,
                 result.recognised.size(),
                 grid->object_count());

  result.grid = std::move(grid);
  result.finish_time = pass.time;
  result.recognition_time = access_time;
  return result;
}

std::vector<Chunk> FieldConstructor::scan(const Environment& reality, Tick time, ConstructionResult& result) {
  std::vector<Chunk> to_encode;
  std::unordered_set<ChunkId> seen;

  for (unsigned int i = 0; i < _config.number_fixations; i++) {
    std::optional<Square> fixation = _fixations.next_fixation(reality, i);
    if (!fixation.has_value()) {
      logger()->debug("Fixation source ended the scan after {} fixations", i);
      break;
    }
    if (fixation->col >= reality.width() || fixation->row >= reality.height()) {
      throw ConstructionError("Fixation " + std::to_string(i) + " at (" + std::to_string(fixation->col) + ", " +
                              std::to_string(fixation->row) + ") is outside scene '" + reality.name() + "'");
    }
    result.stats.incr("construction.fixations");

    ListPattern pattern = fixation_pattern(reality, *fixation, _config.field_of_view);
    if (pattern.empty()) continue;

    std::optional<Chunk> chunk = _recognition.recognise(pattern, time);
    if (!chunk.has_value()) continue;

    result.stats.incr("construction.chunks_recognised");
    result.recognised.push_back(*chunk);
    if (seen.insert(chunk->id).second) {
      to_encode.push_back(std::move(*chunk));
    }
  }
  return to_encode;
}

void FieldConstructor::encode_entry(Pass& pass, const ChunkEntry& entry) {
  const ItemSquarePattern& item = entry.item;
  if (!pass.grid.is_valid_square(item.col, item.row) || is_sentinel_class(item.object_class)) {
    logger()->debug("Skipping chunk entry {} ({} at {}, {})", entry.entry_id, item.object_class, item.col, item.row);
    return;
  }

  Square square(static_cast<GridCoord>(item.col), static_cast<GridCoord>(item.row));
  const SceneObject& real = pass.reality.square_contents(item.col, item.row);
  if (real.object_class == kCreatorToken) return;

  if (real.object_class == item.object_class) {
    encode_recognised_object(pass, square, real);
  } else if (_config.encode_ghost_objects) {
    encode_ghost(pass, square, entry);
  }
}

void FieldConstructor::encode_recognised_object(Pass& pass, const Square& square, const SceneObject& real) {
  pass.time += _config.object_encoding_time;
  pass.stats.incr("construction.objects_recognised");

  SpatialObject* existing = pass.grid.find_alive(square, real.identifier, pass.time);
  if (existing != nullptr && existing->recognised(pass.time) && !existing->is_ghost()) {
    existing->extend_terminus(pass.time + _config.recognised_object_lifespan);
    return;
  }

  pass.grid.overwrite(square, pass.time);
  pass.grid.add_object(square,
                       SpatialObject(real.identifier,
                                     real.object_class,
                                     pass.time,
                                     pass.time + _config.recognised_object_lifespan,
                                     true,
                                     false));
  pass.finalised[square.row][square.col] = true;
}

void FieldConstructor::encode_ghost(Pass& pass, const Square& square, const ChunkEntry& entry) {
  // A real object on the square always wins.
  if (pass.finalised[square.row][square.col]) {
    pass.stats.incr("construction.ghosts_dropped");
    return;
  }

  pass.time += _config.object_encoding_time;

  auto known = pass.ghosts.find(entry.entry_id);
  if (known != pass.ghosts.end() && known->second.square == square) {
    SpatialObject* ghost = pass.grid.find_alive(square, known->second.identifier, pass.time);
    if (ghost != nullptr) {
      ghost->extend_terminus(pass.time + _config.recognised_object_lifespan);
      return;
    }
  } else {
    std::string identifier = kGhostIdentifierPrefix + std::to_string(pass.next_ghost++);
    known = pass.ghosts.insert_or_assign(entry.entry_id, Pass::GhostRecord{identifier, square}).first;
  }

  pass.grid.overwrite(square, pass.time);
  pass.grid.add_object(square,
                       SpatialObject(known->second.identifier,
                                     entry.item.object_class,
                                     pass.time,
                                     pass.time + _config.recognised_object_lifespan,
                                     true,
                                     true));
  pass.stats.incr("construction.ghosts_encoded");
  logger()->debug("Ghost {} ({}) placed at ({}, {}) at {}",
                  known->second.identifier,
                  entry.item.object_class,
                  square.col,
                  square.row,
                  pass.time);
}

// Rows south to north, columns west to east.
void FieldConstructor::raster_pass(Pass& pass) {
  for (GridCoord row = 0; row < pass.reality.height(); row++) {
    for (GridCoord col = 0; col < pass.reality.width(); col++) {
      if (pass.finalised[row][col]) continue;

      const SceneObject& real = pass.reality.square_contents(col, row);
      Square square(col, row);

      if (real.object_class == kBlindSquareToken || real.object_class == kCreatorToken) {
        continue;
      } else if (real.object_class == kEmptySquareToken) {
        pass.time += _config.empty_square_encoding_time;
        pass.grid.overwrite(square, pass.time);
        pass.grid.add_object(
            square, SpatialObject::empty(real.identifier, pass.time, pass.time + _config.unrecognised_object_lifespan));
        pass.stats.incr("construction.empty_squares_encoded");
      } else {
        pass.time += _config.object_encoding_time;
        pass.grid.overwrite(square, pass.time);
        pass.grid.add_object(square,
                             SpatialObject(real.identifier,
                                           real.object_class,
                                           pass.time,
                                           pass.time + _config.unrecognised_object_lifespan,
                                           false,
                                           false));
        pass.stats.incr("construction.objects_unrecognised");
      }
    }
  }
}

}  // namespace vsfield
