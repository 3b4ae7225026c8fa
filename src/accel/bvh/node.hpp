#pragma once

#include <ImathBox.h>

#include <cstdint>
#include <limits>

namespace bvh {
  static const uint32_t INVALID = std::numeric_limits<uint32_t>::max();

  /* binary bvh node. internal nodes reference both children by index,
   * leaves reference a range in the list of primitive indices */
  struct node_t {
    // bounds of everything below this node
    Imath::Box3f bounds;
    // index of the left and right child, if this is an internal node
    uint32_t child[2];
    // offset into the list of primitive indices, if this is a leaf
    uint32_t offset;
    // number of primitives in a leaf, zero for internal nodes
    uint32_t num;
    // index of the parent, INVALID for the root
    uint32_t parent;

    inline node_t()
      : offset(0), num(0), parent(INVALID)
    {
      child[0] = child[1] = INVALID;
    }

    inline bool is_leaf() const {
      return num > 0;
    }

    inline void set_children(uint32_t left, uint32_t right) {
      child[0] = left;
      child[1] = right;
    }

    inline void set_leaf(uint32_t index, uint32_t count) {
      offset = index;
      num    = count;
    }
  };
}
