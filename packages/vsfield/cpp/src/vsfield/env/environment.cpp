#include "env/environment.hpp"

#include <stdexcept>

namespace vsfield {

Environment::Environment(const std::string& name, GridCoord width, GridCoord height)
    : _name(name), _width(width), _height(height), _squares(height, std::vector<SceneObject>(width)) {}

void Environment::check_square(int col, int row) const {
  if (col < 0 || row < 0 || col >= _width || row >= _height) {
    throw std::out_of_range("Square (" + std::to_string(col) + ", " + std::to_string(row) + ") is outside scene '" +
                            _name + "' (" + std::to_string(_width) + "x" + std::to_string(_height) + ")");
  }
}

void Environment::add_item_to_square(int col,
                                     int row,
                                     const std::string& identifier,
                                     const std::string& object_class) {
  check_square(col, row);
  if (object_class == kCreatorToken) {
    std::optional<Square> existing = creator_square();
    if (existing.has_value() && (existing->col != col || existing->row != row)) {
      throw std::invalid_argument("Scene '" + _name + "' already has a creator");
    }
  }
  _squares[row][col] = SceneObject{identifier, object_class};
}

const SceneObject& Environment::square_contents(int col, int row) const {
  check_square(col, row);
  return _squares[row][col];
}

bool Environment::is_entirely_blind() const {
  for (const auto& row : _squares) {
    for (const auto& square : row) {
      if (square.object_class != kBlindSquareToken && square.object_class != kCreatorToken) {
        return false;
      }
    }
  }
  return true;
}

std::optional<Square> Environment::creator_square() const {
  for (GridCoord row = 0; row < _height; row++) {
    for (GridCoord col = 0; col < _width; col++) {
      if (_squares[row][col].object_class == kCreatorToken) {
        return Square(col, row);
      }
    }
  }
  return std::nullopt;
}

bool Environment::operator==(const Environment& other) const {
  return _width == other._width && _height == other._height && _squares == other._squares;
}

}  // namespace vsfield
