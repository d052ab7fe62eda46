#ifndef PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_ENV_ENVIRONMENT_HPP_
#define PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_ENV_ENVIRONMENT_HPP_

#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace vsfield {

struct SceneObject {
  std::string identifier = kBlindSquareToken;
  std::string object_class = kBlindSquareToken;

  bool operator==(const SceneObject& other) const {
    return identifier == other.identifier && object_class == other.object_class;
  }
};

// Rectangular grid of squares, each blind, empty, the creator, or holding one item.
// Used both for the real scene a field is built from and for snapshots of a field.
class Environment {
public:
  Environment(const std::string& name, GridCoord width, GridCoord height);

  const std::string& name() const {
    return _name;
  }

  GridCoord width() const {
    return _width;
  }

  GridCoord height() const {
    return _height;
  }

  void add_item_to_square(int col, int row, const std::string& identifier, const std::string& object_class);

  void add_empty_square(int col, int row) {
    add_item_to_square(col, row, kEmptySquareToken, kEmptySquareToken);
  }

  void add_creator(int col, int row, const std::string& identifier = kCreatorToken) {
    add_item_to_square(col, row, identifier, kCreatorToken);
  }

  const SceneObject& square_contents(int col, int row) const;

  bool is_blind(int col, int row) const {
    return square_contents(col, row).object_class == kBlindSquareToken;
  }

  bool is_empty(int col, int row) const {
    return square_contents(col, row).object_class == kEmptySquareToken;
  }

  bool is_creator(int col, int row) const {
    return square_contents(col, row).object_class == kCreatorToken;
  }

  // Every square is blind, except possibly the one the creator occupies.
  bool is_entirely_blind() const;

  std::optional<Square> creator_square() const;

  // Squares and their contents compare equal; names are ignored.
  bool operator==(const Environment& other) const;

  bool operator!=(const Environment& other) const {
    return !(*this == other);
  }

private:
  void check_square(int col, int row) const;

  std::string _name;
  GridCoord _width;
  GridCoord _height;
  std::vector<std::vector<SceneObject>> _squares;
};

}  // namespace vsfield

#endif  // PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_ENV_ENVIRONMENT_HPP_
