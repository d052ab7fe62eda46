#include <benchmark/benchmark.h>

#include <optional>
#include <random>
#include <string>
#include <vector>

#include "config/field_config.hpp"
#include "core/attention_clock.hpp"
#include "env/environment.hpp"
#include "field/move_engine.hpp"
#include "field/visual_spatial_field.hpp"
#include "recognition/oracles.hpp"
#include "recognition/salient_square_fixations.hpp"

using namespace vsfield;

namespace {

// Recognises every fixation pattern as a chunk of its first three items.
class PatternEcho : public RecognitionSource {
public:
  std::optional<Chunk> recognise(const ListPattern& pattern, Tick /*time*/) override {
    Chunk chunk;
    chunk.id = _next_id++;
    for (size_t i = 0; i < pattern.size() && i < 3; i++) {
      chunk.image.push_back(ChunkEntry{pattern[i], _next_id * 8 + i});
    }
    return chunk;
  }

private:
  ChunkId _next_id = 1;
};

// Square board, roughly a third of squares occupied, a fifth blind, the creator in the middle.
Environment CreateBenchmarkScene(GridCoord size, unsigned int seed) {
  Environment scene("benchmark", size, size);
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> roll(0, 14);
  int next_id = 0;
  for (GridCoord row = 0; row < size; row++) {
    for (GridCoord col = 0; col < size; col++) {
      int r = roll(rng);
      if (r < 3) continue;
      if (r < 8) {
        scene.add_item_to_square(col, row, std::to_string(next_id++), std::string(1, static_cast<char>('A' + r)));
      } else {
        scene.add_empty_square(col, row);
      }
    }
  }
  scene.add_creator(size / 2, size / 2);
  return scene;
}

FieldConfig CreateBenchmarkConfig(unsigned int fixations) {
  FieldConfig config;
  config.access_time = 100;
  config.object_encoding_time = 25;
  config.empty_square_encoding_time = 10;
  config.object_movement_time = 50;
  config.recognised_object_lifespan = 10000;
  config.unrecognised_object_lifespan = 8000;
  config.number_fixations = fixations;
  config.field_of_view = 2;
  config.encode_scene_creator = true;
  config.encode_ghost_objects = true;
  return config;
}

}  // namespace

static void BM_ConstructField(benchmark::State& state) {
  GridCoord size = static_cast<GridCoord>(state.range(0));
  Environment scene = CreateBenchmarkScene(size, 42);
  FieldConfig config = CreateBenchmarkConfig(static_cast<unsigned int>(state.range(1)));

  for (auto _ : state) {
    AttentionClock clock;
    PatternEcho recognition;
    SalientSquareFixations fixations(7);
    VisualSpatialField field(scene, config, 0, &clock, recognition, fixations);
    benchmark::DoNotOptimize(field.attention_clock());
  }
  state.SetItemsProcessed(state.iterations() * size * size);
}
BENCHMARK(BM_ConstructField)->Args({8, 4})->Args({32, 20})->Args({128, 50})->Unit(benchmark::kMicrosecond);

// Moves one object back and forth, letting the cell histories grow.
static void BM_MoveObjects(benchmark::State& state) {
  Environment scene("corridor", 2, 1);
  scene.add_item_to_square(0, 0, "o1", "A");
  scene.add_empty_square(1, 0);
  FieldConfig config = CreateBenchmarkConfig(0);

  AttentionClock clock;
  PatternEcho recognition;
  SalientSquareFixations fixations(7);
  VisualSpatialField field(scene, config, 0, &clock, recognition, fixations);

  int col = 0;
  for (auto _ : state) {
    int next = 1 - col;
    field.move_objects({{MoveStep{"o1", col, 0}, MoveStep{"o1", next, 0}}}, clock.time());
    col = next;
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_MoveObjects);

static void BM_ProjectScene(benchmark::State& state) {
  GridCoord size = static_cast<GridCoord>(state.range(0));
  Environment scene = CreateBenchmarkScene(size, 42);
  FieldConfig config = CreateBenchmarkConfig(20);

  AttentionClock clock;
  PatternEcho recognition;
  SalientSquareFixations fixations(7);
  VisualSpatialField field(scene, config, 0, &clock, recognition, fixations);

  for (auto _ : state) {
    Environment projected = field.as_scene(clock.time(), true);
    benchmark::DoNotOptimize(projected);
  }
  state.SetItemsProcessed(state.iterations() * size * size);
}
BENCHMARK(BM_ProjectScene)->Arg(8)->Arg(32)->Arg(128);

BENCHMARK_MAIN();
