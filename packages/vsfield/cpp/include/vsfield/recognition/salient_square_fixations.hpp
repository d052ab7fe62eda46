#ifndef PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_RECOGNITION_SALIENT_SQUARE_FIXATIONS_HPP_
#define PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_RECOGNITION_SALIENT_SQUARE_FIXATIONS_HPP_

#include <optional>
#include <random>

#include "recognition/oracles.hpp"

namespace vsfield {

// Fixates uniformly at random on squares holding an item. The creator's own square is never chosen.
class SalientSquareFixations : public FixationSource {
public:
  explicit SalientSquareFixations(unsigned int seed) : _rng(seed) {}

  std::optional<Square> next_fixation(const Environment& environment, unsigned int fixation_index) override;

private:
  std::mt19937 _rng;
};

}  // namespace vsfield

#endif  // PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_RECOGNITION_SALIENT_SQUARE_FIXATIONS_HPP_
