#pragma once

#include "primitive.hpp"

namespace accel {
  /**
   * Tests a ray against every primitive it owns. This is the reference
   * for the bvh, so both resolve hits at the exact same distance
   * the same way: the primitive added first wins
   */
  struct list_t : public primitive_t {
    primitives_t primitives;

    list_t();
    list_t(primitives_t primitives);

    void add(primitive_t::scoped_t primitive);

    inline size_t size() const {
      return primitives.size();
    }

    std::optional<interaction_t> intersect(
      const ray_t& ray
    , float t_min
    , float t_max) const override;

    Imath::Box3f bounds(float time0, float time1) const override;
  };
}
