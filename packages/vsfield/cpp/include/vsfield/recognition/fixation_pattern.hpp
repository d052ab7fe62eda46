#ifndef PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_RECOGNITION_FIXATION_PATTERN_HPP_
#define PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_RECOGNITION_FIXATION_PATTERN_HPP_

#include "core/types.hpp"
#include "env/environment.hpp"
#include "recognition/chunk.hpp"

namespace vsfield {

// Drops blind squares, empty squares, the creator and repeated items, keeping first occurrences in order.
ListPattern normalise(const ListPattern& pattern);

// Items within `field_of_view` squares (Chebyshev distance) of `fixation`, raster order, normalised.
ListPattern fixation_pattern(const Environment& environment, const Square& fixation, unsigned int field_of_view);

}  // namespace vsfield

#endif  // PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_RECOGNITION_FIXATION_PATTERN_HPP_
