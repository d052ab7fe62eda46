#ifndef PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_RECOGNITION_CHUNK_HPP_
#define PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_RECOGNITION_CHUNK_HPP_

#include <string>
#include <vector>

#include "core/types.hpp"

namespace vsfield {

// An object class seen at an absolute (col, row).
struct ItemSquarePattern {
  std::string object_class;
  int col = 0;
  int row = 0;

  bool operator==(const ItemSquarePattern& other) const {
    return object_class == other.object_class && col == other.col && row == other.row;
  }
};

using ListPattern = std::vector<ItemSquarePattern>;

struct ChunkEntry {
  ItemSquarePattern item;
  // Stable identity assigned by the recognition oracle. Ghost objects hypothesised from the same
  // entry are the same ghost.
  EntryId entry_id = 0;
};

// A learned pattern returned by the recognition oracle.
struct Chunk {
  ChunkId id = 0;
  std::vector<ChunkEntry> image;
};

}  // namespace vsfield

#endif  // PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_RECOGNITION_CHUNK_HPP_
