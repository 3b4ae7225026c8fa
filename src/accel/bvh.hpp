#pragma once

#include "primitive.hpp"
#include "bvh/node.hpp"
#include "bvh/builder.hpp"

struct predictor_t;

namespace accel {
  /**
   * Binary bounding volume hierarchy over a set of primitives it owns.
   * Nodes are stored in a flat array in depth first order, leaves hold
   * ranges of indices into the primitives, which keep the order they
   * were handed in. The tree is built once for a fixed time interval and
   * is read only afterwards. A bvh is a primitive itself, so trees can
   * be nested
   */
  struct bvh_t : public primitive_t {
    static const uint32_t STACK_SIZE = 128;

    typedef bvh::sink_t<bvh::node_t> sink_t;

    struct details_t;

    details_t* details;

    // pointer to the beginning of the flat array of nodes, the first
    // node is the root
    const bvh::node_t* root;
    // the number of nodes in the tree
    uint32_t num_nodes;

    bvh_t(primitives_t primitives, float time0 = 0.0f, float time1 = 0.0f);
    ~bvh_t();

    bvh_t(const bvh_t&) = delete;
    bvh_t& operator=(const bvh_t&) = delete;

    std::optional<interaction_t> intersect(
      const ray_t& ray
    , float t_min
    , float t_max) const override;

    /* closest hit, with an optional predictor ordering the traversal */
    std::optional<interaction_t> intersect(
      const ray_t& ray
    , float t_min
    , float t_max
    , predictor_t* predictor) const;

    Imath::Box3f bounds(float time0, float time1) const override;

    uint32_t num_primitives() const;

    const primitive_t* primitive(uint32_t i) const;

    /* primitive indices referenced by the leaf 'node' */
    const uint32_t* indices(const bvh::node_t& node) const;
  };
}
