#pragma once

#include "state.hpp"

#include <ImathBox.h>

#include <algorithm>
#include <cmath>

namespace aabb {
  inline float area(const Imath::Box3f& box) {
    if (box.isEmpty()) {
      return 0.0f;
    }
    auto d = box.max - box.min;
    return 2.0 * (d.x * d.y + d.x * d.z + d.y * d.z);
  }

  /* grow flat boxes along their thin axes, so slab tests never see
   * a zero width interval */
  inline Imath::Box3f padded(const Imath::Box3f& box, float delta = 0.0001f) {
    Imath::Box3f out = box;
    for (auto axis=0; axis<3; ++axis) {
      if (out.max[axis] - out.min[axis] < delta) {
        out.min[axis] -= delta * 0.5f;
        out.max[axis] += delta * 0.5f;
      }
    }
    return out;
  }

  /**
   * Slab test. Intersects the parametric ranges of the ray inside each
   * pair of planes with [t_min, t_max], rejects the box as soon as the
   * running interval becomes empty. On success 'entry' holds the
   * distance at which the ray enters the box, clamped to t_min
   */
  inline bool intersect(
    const Imath::Box3f& box
  , const ray_t& ray
  , float t_min
  , float t_max
  , float& entry)
  {
    for (auto axis=0; axis<3; ++axis) {
      const auto d = ray.wi[axis];
      const auto o = ray.p[axis];

      if (d == 0.0f) {
        // parallel to the slab, the origin decides
        if (o < box.min[axis] || o > box.max[axis]) {
          return false;
        }
        continue;
      }

      const auto inv = 1.0f / d;
      auto t0 = (box.min[axis] - o) * inv;
      auto t1 = (box.max[axis] - o) * inv;

      if (inv < 0.0f) {
        std::swap(t0, t1);
      }

      t_min = t0 > t_min ? t0 : t_min;
      t_max = t1 < t_max ? t1 : t_max;

      if (t_max < t_min) {
        return false;
      }
    }

    entry = t_min;
    return true;
  }

  inline bool intersect(
    const Imath::Box3f& box
  , const ray_t& ray
  , float t_min
  , float t_max)
  {
    float entry;
    return intersect(box, ray, t_min, t_max, entry);
  }

  /* checks that 'outer' encloses 'inner', with some slack for rounding */
  inline bool contains(const Imath::Box3f& outer, const Imath::Box3f& inner, float eps = 1e-5f) {
    if (inner.isEmpty()) {
      return true;
    }
    for (auto axis=0; axis<3; ++axis) {
      if (inner.min[axis] < outer.min[axis] - eps || inner.max[axis] > outer.max[axis] + eps) {
        return false;
      }
    }
    return true;
  }
}
