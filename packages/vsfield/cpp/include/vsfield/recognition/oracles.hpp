#ifndef PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_RECOGNITION_ORACLES_HPP_
#define PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_RECOGNITION_ORACLES_HPP_

#include <optional>

#include "core/types.hpp"
#include "env/environment.hpp"
#include "recognition/chunk.hpp"

namespace vsfield {

// Long-term memory lookup. Called synchronously during field construction.
class RecognitionSource {
public:
  virtual ~RecognitionSource() = default;
  virtual std::optional<Chunk> recognise(const ListPattern& pattern, Tick time) = 0;
};

// Chooses the square to fixate on next. Returning nullopt ends the scan early.
class FixationSource {
public:
  virtual ~FixationSource() = default;
  virtual std::optional<Square> next_fixation(const Environment& environment, unsigned int fixation_index) = 0;
};

// Receives every chunk recognised while a field is constructed.
class ShortTermMemory {
public:
  virtual ~ShortTermMemory() = default;
  virtual void push(const Chunk& chunk, Tick time) = 0;
};

}  // namespace vsfield

#endif  // PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_RECOGNITION_ORACLES_HPP_
