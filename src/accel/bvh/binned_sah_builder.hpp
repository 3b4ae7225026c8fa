#pragma once

#include "builder.hpp"
#include "node.hpp"
#include "math/aabb.hpp"

#include <ImathBox.h>
#include <ImathVec.h>

#include <algorithm>
#include <limits>
#include <vector>

namespace bvh {
  static const uint32_t MAX_PRIMS_IN_NODE = 4;
  static const uint32_t NUM_SPLIT_BINS    = 12;
  // below this depth splits fall back to the median, which keeps
  // the tree shallow enough for fixed size traversal stacks
  static const uint32_t MAX_SAH_DEPTH     = 64;

  /**
   * Build information about a subset of the primitives in the scene
   */
  struct geometry_t {
    // information relevant for the build, about the primtivies in the scene
    std::vector<reference_t>* references;
    // indices into the references vector
    uint32_t start, end;
    // the bounding volume for this subset of the primitives in the scene
    Imath::Box3f bounds;
    Imath::Box3f centroid_bounds;

    inline geometry_t()
      : references(nullptr), start(0), end(0)
    {}

    inline geometry_t(
        std::vector<reference_t>& references
      , uint32_t start
      , uint32_t end)
      : references(&references), start(start), end(end)
    {
      for (auto i=start; i<end; ++i) {
        bounds.extendBy(references[i].bounds);
        centroid_bounds.extendBy(references[i].centroid);
      }
    }

    inline uint32_t count() const {
      return end - start;
    }

    inline const reference_t& reference(uint32_t i) const {
      return (*references)[start+i];
    }

    template<typename F>
    inline void partition(const F& f, geometry_t& l, geometry_t& r) {
      auto first = references->begin() + start;
      auto last  = references->begin() + end;
      auto p     = std::partition(first, last, f);
      auto mid   = (uint32_t) (p - references->begin());

      l = {*references, start, mid};
      r = {*references, mid, end};
    }
  };

  struct split_t {
    uint32_t axis;
    uint32_t bin;
    float    cost;

    inline split_t(uint32_t axis, uint32_t bin, float cost)
      : axis(axis), bin(bin), cost(cost)
    {}

    inline bool is_valid() const {
      return cost < std::numeric_limits<float>::max();
    }
  };

  struct bin_t {
    uint32_t     count;
    Imath::Box3f bounds;

    inline bin_t()
      : count(0)
    {}

    inline void add(const reference_t& p) {
      bounds.extendBy(p.bounds);
      count++;
    }
  };

  template<int N>
  struct bins_t {
    bin_t bins[N];

    inline const bin_t& operator[](uint32_t i) const {
      return bins[i];
    }

    inline void add(const Imath::Box3f& bounds, const reference_t& p, uint8_t axis) {
      bins[find(bounds, p, axis)].add(p);
    }

    static inline Imath::V3f offset(const Imath::Box3f& l, const Imath::V3f& r) {
      auto o = r - l.min;
      if (l.max.x > l.min.x) { o.x /= (l.max.x - l.min.x); }
      if (l.max.y > l.min.y) { o.y /= (l.max.y - l.min.y); }
      if (l.max.z > l.min.z) { o.z /= (l.max.z - l.min.z); }
      return o;
    }

    static inline uint32_t find(const Imath::Box3f& bounds, const reference_t& p, uint8_t axis) {
      auto off = offset(bounds, p.centroid)[axis];
      return (uint32_t) std::clamp((int) (N * off), 0, N-1);
    }
  };

  inline bool too_large(const geometry_t& g) {
    return g.count() > MAX_PRIMS_IN_NODE;
  }

  /* cheapest binned split over all three axes, by surface area */
  inline split_t find(const geometry_t& geometry) {
    auto best_axis = 0u;
    auto best_bin  = 0u;
    auto best_cost = std::numeric_limits<float>::max();

    const auto parent_area = aabb::area(geometry.bounds);

    for (auto axis=0; axis<3; ++axis) {
      // all centroids in one plane, nothing to split on this axis
      if (!(geometry.centroid_bounds.max[axis] > geometry.centroid_bounds.min[axis])) {
        continue;
      }

      bins_t<NUM_SPLIT_BINS> bins;
      for (auto i=0u; i<geometry.count(); ++i) {
        bins.add(geometry.centroid_bounds, geometry.reference(i), axis);
      }

      for (auto i=0u; i<NUM_SPLIT_BINS-1; ++i) {
        Imath::Box3f a, b;
        auto left = 0u; auto right = 0u;
        for (auto j=0u; j<=i; ++j) {
          a.extendBy(bins[j].bounds);
          left += bins[j].count;
        }

        for (auto j=i+1; j<NUM_SPLIT_BINS; ++j) {
          b.extendBy(bins[j].bounds);
          right += bins[j].count;
        }

        if (left == 0 || right == 0) {
          continue;
        }

        auto cost = left * aabb::area(a) + right * aabb::area(b);
        if (parent_area > 0.0f) {
          cost /= parent_area;
        }

        if (cost < best_cost) {
          best_axis = axis;
          best_cost = cost;
          best_bin  = i;
        }
      }
    }
    return split_t(best_axis, best_bin, best_cost);
  }

  inline void split(const split_t& split, geometry_t& parent, geometry_t& l, geometry_t& r) {
    const auto bounds = parent.centroid_bounds;
    parent.partition([&](const reference_t& p) {
        auto bin = bins_t<NUM_SPLIT_BINS>::find(bounds, p, split.axis);
        return bin <= split.bin;
      }, l, r);
  }

  /* halves the primitives along the axis of largest centroid extent */
  inline void median_split(geometry_t& parent, geometry_t& l, geometry_t& r) {
    const auto extent = parent.centroid_bounds.isEmpty()
      ? Imath::V3f(0.0f)
      : parent.centroid_bounds.size();

    auto axis = 0;
    if (extent.y > extent[axis]) { axis = 1; }
    if (extent.z > extent[axis]) { axis = 2; }

    auto& references = *parent.references;
    const auto mid = parent.start + parent.count() / 2;

    std::nth_element(
      references.begin() + parent.start
    , references.begin() + mid
    , references.begin() + parent.end
    , [axis](const reference_t& a, const reference_t& b) {
        if (a.centroid[axis] == b.centroid[axis]) {
          return a.index < b.index;
        }
        return a.centroid[axis] < b.centroid[axis];
      });

    l = {references, parent.start, mid};
    r = {references, mid, parent.end};
  }

  template<typename Node>
  uint32_t from(geometry_t& geometry, sink_t<Node>& bvh, uint32_t parent, uint32_t depth) {
    const auto node_index = bvh.push_node();
    {
      auto& node = bvh.node(node_index);
      node.bounds = geometry.bounds;
      node.parent = parent;
    }

    if (!too_large(geometry)) {
      const auto first  = geometry.references->cbegin() + geometry.start;
      const auto offset = bvh.push_leaf(first, first + geometry.count());
      bvh.node(node_index).set_leaf(offset, geometry.count());
      return node_index;
    }

    geometry_t l, r;

    const auto s = depth < MAX_SAH_DEPTH ? find(geometry) : split_t(0, 0, std::numeric_limits<float>::max());
    if (s.is_valid()) {
      split(s, geometry, l, r);
    }

    if (!s.is_valid() || l.count() == 0 || r.count() == 0) {
      median_split(geometry, l, r);
    }

    const auto left  = from(l, bvh, node_index, depth + 1);
    const auto right = from(r, bvh, node_index, depth + 1);

    // the node array may have grown, look the node up again
    bvh.node(node_index).set_children(left, right);

    return node_index;
  }

  template<typename Node>
  void from(sink_t<Node>& bvh, std::vector<reference_t>& references) {
    if (references.empty()) {
      return;
    }

    geometry_t geometry(references, 0, references.size());
    from(geometry, bvh, INVALID, 0);
  }
}
