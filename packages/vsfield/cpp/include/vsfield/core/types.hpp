#ifndef PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_CORE_TYPES_HPP_
#define PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_CORE_TYPES_HPP_

#include <cstdint>
#include <functional>
#include <string>

namespace vsfield {

// Logical simulated time. Never wall-clock.
using Tick = int64_t;
using GridCoord = uint16_t;

// Identity the recognition oracle gives to one entry of a chunk image.
using EntryId = uint64_t;
using ChunkId = uint64_t;

// Column 0 is the west edge, row 0 the south edge.
class Square {
public:
  GridCoord col;
  GridCoord row;

  inline Square(GridCoord col, GridCoord row) : col(col), row(row) {}
  inline Square() : col(0), row(0) {}

  inline bool operator==(const Square& other) const {
    return col == other.col && row == other.row;
  }

  inline bool operator!=(const Square& other) const {
    return !(*this == other);
  }
};

// Sentinel tokens shared by environments and fields.
inline const std::string kBlindSquareToken = "null";
inline const std::string kEmptySquareToken = ".";
inline const std::string kCreatorToken = "SELF";
inline const std::string kGhostIdentifierPrefix = "ghost";

inline bool is_sentinel_class(const std::string& object_class) {
  return object_class == kBlindSquareToken || object_class == kEmptySquareToken || object_class == kCreatorToken;
}

}  // namespace vsfield

template <>
struct std::hash<vsfield::Square> {
  size_t operator()(const vsfield::Square& square) const noexcept {
    return (static_cast<size_t>(square.row) << 16) | square.col;
  }
};

#endif  // PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_CORE_TYPES_HPP_
