#ifndef PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_FIELD_FIELD_CONSTRUCTOR_HPP_
#define PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_FIELD_FIELD_CONSTRUCTOR_HPP_

#include <memory>
#include <vector>

#include "config/field_config.hpp"
#include "core/spatial_grid.hpp"
#include "core/types.hpp"
#include "env/environment.hpp"
#include "recognition/chunk.hpp"
#include "recognition/oracles.hpp"
#include "systems/stats_tracker.hpp"

namespace vsfield {

struct ConstructionResult {
  std::unique_ptr<SpatialGrid> grid;
  // Time attention is released. The start time itself when nothing could be seen.
  Tick finish_time = 0;
  Tick recognition_time = 0;
  // Every chunk recognised during the scan, in order, repeats included.
  std::vector<Chunk> recognised;
  StatsTracker stats;
};

// Scans an environment through the fixation and recognition oracles and assembles a SpatialGrid.
// build() has no side effects outside its result, so a failed construction leaves nothing behind.
class FieldConstructor {
public:
  FieldConstructor(const FieldConfig& config, RecognitionSource& recognition, FixationSource& fixations)
      : _config(config), _recognition(recognition), _fixations(fixations) {}

  ConstructionResult build(const Environment& reality, Tick start_time);

private:
  struct Pass;

  std::vector<Chunk> scan(const Environment& reality, Tick time, ConstructionResult& result);
  void encode_entry(Pass& pass, const ChunkEntry& entry);
  void encode_recognised_object(Pass& pass, const Square& square, const SceneObject& real);
  void encode_ghost(Pass& pass, const Square& square, const ChunkEntry& entry);
  void raster_pass(Pass& pass);

  const FieldConfig& _config;
  RecognitionSource& _recognition;
  FixationSource& _fixations;
};

}  // namespace vsfield

#endif  // PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_FIELD_FIELD_CONSTRUCTOR_HPP_
