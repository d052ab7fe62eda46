#include "recognition/fixation_pattern.hpp"

#include <algorithm>

namespace vsfield {

ListPattern normalise(const ListPattern& pattern) {
  ListPattern normalised;
  for (const auto& item : pattern) {
    if (is_sentinel_class(item.object_class)) continue;
    if (std::find(normalised.begin(), normalised.end(), item) != normalised.end()) continue;
    normalised.push_back(item);
  }
  return normalised;
}

ListPattern fixation_pattern(const Environment& environment, const Square& fixation, unsigned int field_of_view) {
  int radius = static_cast<int>(field_of_view);
  int row_start = std::max(0, static_cast<int>(fixation.row) - radius);
  int row_end = std::min(static_cast<int>(environment.height()), static_cast<int>(fixation.row) + radius + 1);
  int col_start = std::max(0, static_cast<int>(fixation.col) - radius);
  int col_end = std::min(static_cast<int>(environment.width()), static_cast<int>(fixation.col) + radius + 1);

  ListPattern pattern;
  for (int row = row_start; row < row_end; ++row) {
    for (int col = col_start; col < col_end; ++col) {
      pattern.push_back(ItemSquarePattern{environment.square_contents(col, row).object_class, col, row});
    }
  }
  return normalise(pattern);
}

}  // namespace vsfield
