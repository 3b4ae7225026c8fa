#pragma once

#include <ImathBox.h>
#include <ImathVec.h>

#include <cstdint>
#include <vector>

namespace bvh {
  /* a primitive as seen by the build: its position in the scene list,
   * its bounds over the shutter interval, and the center of those bounds.
   * unbounded primitives are binned at the origin */
  struct reference_t {
    uint32_t     index;
    Imath::Box3f bounds;
    Imath::V3f   centroid;

    inline reference_t()
      : index(0), centroid(0.0f)
    {}

    inline reference_t(uint32_t index, const Imath::Box3f& bounds)
      : index(index)
      , bounds(bounds)
      , centroid(bounds.isEmpty() ? Imath::V3f(0.0f) : bounds.center())
    {}
  };

  typedef std::vector<reference_t>::const_iterator reference_iterator_t;

  /* where the build puts its output. nodes are addressed by index, since
   * the storage behind them may move while the tree grows */
  template<typename Node>
  struct sink_t {
    virtual ~sink_t() {}

    /* append an empty node, returns its index */
    virtual uint32_t push_node() = 0;

    virtual Node& node(uint32_t index) = 0;

    /* append the primitives of one leaf, returns the position of the
     * first one in the leaf index list */
    virtual uint32_t push_leaf(reference_iterator_t first, reference_iterator_t last) = 0;
  };
}
