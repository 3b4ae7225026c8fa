#include "bvh.hpp"
#include "predictor.hpp"
#include "bvh/binned_sah_builder.hpp"
#include "math/aabb.hpp"

#include <limits>
#include <vector>

namespace accel {
  struct bvh_t::details_t {
    typedef std::vector<bvh::node_t> nodes_t;

    nodes_t nodes;
    // leaves point into this list, which points into the primitives
    std::vector<uint32_t> indices;
    primitives_t primitives;
  };

  namespace {
    /* nodes in depth first order, with the left child following
     * its parent */
    struct flat_sink_t : public bvh_t::sink_t {
      bvh_t::details_t& details;

      flat_sink_t(bvh_t::details_t& details)
        : details(details)
      {}

      uint32_t push_node() override {
        details.nodes.emplace_back();
        return details.nodes.size() - 1;
      }

      bvh::node_t& node(uint32_t index) override {
        return details.nodes[index];
      }

      uint32_t push_leaf(bvh::reference_iterator_t first, bvh::reference_iterator_t last) override {
        const uint32_t offset = details.indices.size();
        for (; first != last; ++first) {
          details.indices.push_back(first->index);
        }
        return offset;
      }
    };

    struct entry_t {
      uint32_t node;
      float    t;
    };

    inline bool closer(const interaction_t& hit, const std::optional<interaction_t>& best, uint32_t index) {
      return !best
        || hit.t < best->t
        || (hit.t == best->t && index < best->primitive);
    }
  }

  bvh_t::bvh_t(primitives_t primitives, float time0, float time1)
    : details(new details_t())
    , root(nullptr)
    , num_nodes(0)
  {
    details->primitives = std::move(primitives);

    std::vector<bvh::reference_t> references;
    references.reserve(details->primitives.size());

    for (uint32_t i=0; i<details->primitives.size(); ++i) {
      references.emplace_back(i, details->primitives[i]->bounds(time0, time1));
    }

    flat_sink_t sink(*details);
    bvh::from(sink, references);

    root      = details->nodes.empty() ? nullptr : details->nodes.data();
    num_nodes = details->nodes.size();
  }

  bvh_t::~bvh_t() {
    delete details;
  }

  std::optional<interaction_t> bvh_t::intersect(
    const ray_t& ray
  , float t_min
  , float t_max) const
  {
    return intersect(ray, t_min, t_max, nullptr);
  }

  std::optional<interaction_t> bvh_t::intersect(
    const ray_t& ray
  , float t_min
  , float t_max
  , predictor_t* predictor) const
  {
    if (!root || ray.is_degenerate()) {
      return std::nullopt;
    }

    float entry;
    if (!aabb::intersect(root->bounds, ray, t_min, t_max, entry)) {
      return std::nullopt;
    }

    const auto& nodes      = details->nodes;
    const auto& indices    = details->indices;
    const auto& primitives = details->primitives;

    const auto key = predictor ? predictor_t::hash(ray) : 0;

    std::optional<interaction_t> best;
    auto best_leaf = bvh::INVALID;

    entry_t stack[STACK_SIZE];
    auto top = 0;

    stack[top++] = { 0, entry };

    while (top > 0) {
      const auto current = stack[--top];

      // something closer was found since this node was pushed
      if (best && current.t > best->t) {
        continue;
      }

      const auto& node = nodes[current.node];

      if (node.is_leaf()) {
        auto found = false;

        for (auto i=node.offset; i<node.offset+node.num; ++i) {
          const auto index = indices[i];
          const auto max   = best ? best->t : t_max;

          auto hit = primitives[index]->intersect(ray, t_min, max);
          if (hit && closer(*hit, best, index)) {
            hit->primitive = index;
            best      = hit;
            best_leaf = current.node;
            found     = true;
          }
        }

        if (predictor) {
          predictor->record(key, current.node, found ? predictor_t::LEAF_HIT : predictor_t::LEAF_MISS);
        }
        continue;
      }

      const auto max = best ? best->t : t_max;
      const auto l = node.child[0];
      const auto r = node.child[1];

      float tl = std::numeric_limits<float>::infinity();
      float tr = std::numeric_limits<float>::infinity();
      const auto hit_l = aabb::intersect(nodes[l].bounds, ray, t_min, max, tl);
      const auto hit_r = aabb::intersect(nodes[r].bounds, ray, t_min, max, tr);

      auto left_first = tl <= tr;
      if (predictor) {
        const auto hint = predictor->lookup(key, current.node);
        if (hint && (*hint == predictor_t::LEFT_FIRST || *hint == predictor_t::RIGHT_FIRST)) {
          left_first = *hint == predictor_t::LEFT_FIRST;
        }
      }

      if (hit_l && hit_r) {
        // the node visited first goes on the stack last
        if (left_first) {
          stack[top++] = { r, tr };
          stack[top++] = { l, tl };
        }
        else {
          stack[top++] = { l, tl };
          stack[top++] = { r, tr };
        }
      }
      else if (hit_l) {
        stack[top++] = { l, tl };
      }
      else if (hit_r) {
        stack[top++] = { r, tr };
      }
    }

    // remember which side the closest hit was found on, along the
    // path from the root
    if (predictor && best_leaf != bvh::INVALID) {
      auto child = best_leaf;
      auto parent = nodes[child].parent;

      while (parent != bvh::INVALID) {
        const auto outcome = nodes[parent].child[0] == child
          ? predictor_t::LEFT_FIRST
          : predictor_t::RIGHT_FIRST;

        predictor->record(key, parent, outcome);

        child  = parent;
        parent = nodes[child].parent;
      }
    }

    return best;
  }

  Imath::Box3f bvh_t::bounds(float, float) const {
    if (root) {
      return root->bounds;
    }
    return Imath::Box3f();
  }

  uint32_t bvh_t::num_primitives() const {
    return details->primitives.size();
  }

  const primitive_t* bvh_t::primitive(uint32_t i) const {
    return details->primitives[i].get();
  }

  const uint32_t* bvh_t::indices(const bvh::node_t& node) const {
    return details->indices.data() + node.offset;
  }
}
