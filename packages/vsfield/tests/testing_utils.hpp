#ifndef PACKAGES_VSFIELD_TESTS_TESTING_UTILS_HPP_
#define PACKAGES_VSFIELD_TESTS_TESTING_UTILS_HPP_

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "config/field_config.hpp"
#include "env/environment.hpp"
#include "recognition/chunk.hpp"
#include "recognition/oracles.hpp"

namespace vsfield::test_utils {

// Fixates on a fixed list of squares, then ends the scan.
class ScriptedFixations : public FixationSource {
public:
  explicit ScriptedFixations(std::vector<Square> squares = {}) : _squares(std::move(squares)) {}

  std::optional<Square> next_fixation(const Environment& /*environment*/, unsigned int fixation_index) override {
    if (fixation_index >= _squares.size()) {
      return std::nullopt;
    }
    return _squares[fixation_index];
  }

private:
  std::vector<Square> _squares;
};

// Answers successive recognise() calls from a script and records what it was asked.
class ScriptedRecognition : public RecognitionSource {
public:
  explicit ScriptedRecognition(std::vector<std::optional<Chunk>> responses = {}) : _responses(std::move(responses)) {}

  std::optional<Chunk> recognise(const ListPattern& pattern, Tick time) override {
    patterns.push_back(pattern);
    times.push_back(time);
    size_t call = patterns.size() - 1;
    if (call >= _responses.size()) {
      return std::nullopt;
    }
    return _responses[call];
  }

  std::vector<ListPattern> patterns;
  std::vector<Tick> times;

private:
  std::vector<std::optional<Chunk>> _responses;
};

class RecordingShortTermMemory : public ShortTermMemory {
public:
  void push(const Chunk& chunk, Tick time) override {
    pushed.emplace_back(chunk.id, time);
  }

  std::vector<std::pair<ChunkId, Tick>> pushed;
};

struct EntryDef {
  std::string object_class;
  int col;
  int row;
  EntryId entry_id;
};

inline Chunk make_chunk(ChunkId id, const std::vector<EntryDef>& entries) {
  Chunk chunk;
  chunk.id = id;
  for (const auto& entry : entries) {
    chunk.image.push_back(ChunkEntry{ItemSquarePattern{entry.object_class, entry.col, entry.row}, entry.entry_id});
  }
  return chunk;
}

inline FieldConfig default_test_config() {
  FieldConfig config;
  config.access_time = 20;
  config.object_encoding_time = 10;
  config.empty_square_encoding_time = 5;
  config.object_movement_time = 50;
  config.recognised_object_lifespan = 60000;
  config.unrecognised_object_lifespan = 30000;
  config.number_fixations = 0;
  config.field_of_view = 0;
  return config;
}

}  // namespace vsfield::test_utils

#endif  // PACKAGES_VSFIELD_TESTS_TESTING_UTILS_HPP_
