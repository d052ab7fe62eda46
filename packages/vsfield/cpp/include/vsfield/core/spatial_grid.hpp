#ifndef PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_CORE_SPATIAL_GRID_HPP_
#define PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_CORE_SPATIAL_GRID_HPP_

#include <string>
#include <vector>

#include "core/spatial_object.hpp"
#include "core/types.hpp"

namespace vsfield {

// Per-cell, creation-ordered history of SpatialObjects. Cells are indexed [row][col].
using CellHistory = std::vector<SpatialObject>;

class SpatialGrid {
public:
  const GridCoord width;
  const GridCoord height;

  SpatialGrid(GridCoord width, GridCoord height);

  inline bool is_valid_square(int col, int row) const {
    return col >= 0 && row >= 0 && col < width && row < height;
  }

  inline bool is_valid_square(const Square& square) const {
    return square.col < width && square.row < height;
  }

  const CellHistory& contents(const Square& square) const;
  CellHistory& mutable_contents(const Square& square);

  // Appends to the cell's history. The returned reference is invalidated by the next append to the same cell.
  SpatialObject& add_object(const Square& square, SpatialObject object);

  std::vector<const SpatialObject*> alive_at(const Square& square, Tick time) const;

  // Most recently created alive object with this identifier, or nullptr.
  SpatialObject* find_alive(const Square& square, const std::string& identifier, Tick time);
  const SpatialObject* find_alive(const Square& square, const std::string& identifier, Tick time) const;

  bool has_alive_object(const Square& square, Tick time) const;

  // Ends every alive blind, empty or ghost object on the cell at `time`. Returns how many were ended.
  size_t overwrite(const Square& square, Tick time);

  // Throws DuplicateObjectError if an identifier other than a blind/empty placeholder occurs on two squares.
  void check_for_duplicate_objects() const;

  size_t object_count() const;

private:
  std::vector<std::vector<CellHistory>> _cells;
};

}  // namespace vsfield

#endif  // PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_CORE_SPATIAL_GRID_HPP_
