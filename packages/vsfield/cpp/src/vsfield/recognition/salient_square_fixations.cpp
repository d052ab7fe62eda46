#include "recognition/salient_square_fixations.hpp"

#include <vector>

namespace vsfield {

std::optional<Square> SalientSquareFixations::next_fixation(const Environment& environment,
                                                            unsigned int /*fixation_index*/) {
  std::vector<Square> candidates;
  for (GridCoord row = 0; row < environment.height(); row++) {
    for (GridCoord col = 0; col < environment.width(); col++) {
      if (is_sentinel_class(environment.square_contents(col, row).object_class)) continue;
      candidates.emplace_back(col, row);
    }
  }
  if (candidates.empty()) {
    return std::nullopt;
  }

  std::uniform_int_distribution<size_t> pick(0, candidates.size() - 1);
  return candidates[pick(_rng)];
}

}  // namespace vsfield
