#include "core/spatial_grid.hpp"

#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

#include "core/errors.hpp"

namespace vsfield {

SpatialGrid::SpatialGrid(GridCoord width, GridCoord height)
    : width(width), height(height), _cells(height, std::vector<CellHistory>(width)) {}

const CellHistory& SpatialGrid::contents(const Square& square) const {
  if (!is_valid_square(square)) {
    throw std::out_of_range("Square (" + std::to_string(square.col) + ", " + std::to_string(square.row) +
                            ") is outside a " + std::to_string(width) + "x" + std::to_string(height) + " field");
  }
  return _cells[square.row][square.col];
}

CellHistory& SpatialGrid::mutable_contents(const Square& square) {
  return const_cast<CellHistory&>(static_cast<const SpatialGrid*>(this)->contents(square));
}

SpatialObject& SpatialGrid::add_object(const Square& square, SpatialObject object) {
  CellHistory& cell = mutable_contents(square);
  cell.push_back(std::move(object));
  return cell.back();
}

std::vector<const SpatialObject*> SpatialGrid::alive_at(const Square& square, Tick time) const {
  std::vector<const SpatialObject*> alive;
  for (const auto& object : contents(square)) {
    if (object.alive(time)) {
      alive.push_back(&object);
    }
  }
  return alive;
}

SpatialObject* SpatialGrid::find_alive(const Square& square, const std::string& identifier, Tick time) {
  CellHistory& cell = mutable_contents(square);
  for (auto it = cell.rbegin(); it != cell.rend(); ++it) {
    if (it->identifier() == identifier && it->alive(time)) {
      return &*it;
    }
  }
  return nullptr;
}

const SpatialObject* SpatialGrid::find_alive(const Square& square, const std::string& identifier, Tick time) const {
  return const_cast<SpatialGrid*>(this)->find_alive(square, identifier, time);
}

bool SpatialGrid::has_alive_object(const Square& square, Tick time) const {
  for (const auto& object : contents(square)) {
    if (object.alive(time)) {
      return true;
    }
  }
  return false;
}

size_t SpatialGrid::overwrite(const Square& square, Tick time) {
  size_t ended = 0;
  for (auto& object : mutable_contents(square)) {
    if ((object.is_placeholder() || object.is_ghost()) && object.alive(time)) {
      object.set_terminus(time);
      ended++;
    }
  }
  return ended;
}

void SpatialGrid::check_for_duplicate_objects() const {
  std::unordered_map<std::string, Square> seen;
  for (GridCoord row = 0; row < height; row++) {
    for (GridCoord col = 0; col < width; col++) {
      for (const auto& object : _cells[row][col]) {
        if (object.is_placeholder()) continue;

        Square here(col, row);
        auto [it, inserted] = seen.emplace(object.identifier(), here);
        if (!inserted && it->second != here) {
          throw DuplicateObjectError(object.identifier());
        }
      }
    }
  }
}

size_t SpatialGrid::object_count() const {
  size_t count = 0;
  for (const auto& row : _cells) {
    for (const auto& cell : row) {
      count += cell.size();
    }
  }
  return count;
}

}  // namespace vsfield
