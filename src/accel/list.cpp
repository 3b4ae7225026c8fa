#include "list.hpp"

namespace accel {
  list_t::list_t()
  {}

  list_t::list_t(primitives_t primitives)
    : primitives(std::move(primitives))
  {}

  void list_t::add(primitive_t::scoped_t primitive) {
    primitives.emplace_back(std::move(primitive));
  }

  std::optional<interaction_t> list_t::intersect(
    const ray_t& ray
  , float t_min
  , float t_max) const
  {
    std::optional<interaction_t> closest;

    for (uint32_t i=0; i<primitives.size(); ++i) {
      const auto max = closest ? closest->t : t_max;

      auto hit = primitives[i]->intersect(ray, t_min, max);
      if (hit && (!closest || hit->t < closest->t)) {
        hit->primitive = i;
        closest = hit;
      }
    }

    return closest;
  }

  Imath::Box3f list_t::bounds(float time0, float time1) const {
    Imath::Box3f out;
    for (const auto& p : primitives) {
      out.extendBy(p->bounds(time0, time1));
    }
    return out;
  }
}
