#include "box.hpp"
#include "rect.hpp"
#include "math/aabb.hpp"

#include <algorithm>

box_t::box_t(const Imath::V3f& p0, const Imath::V3f& p1, const material_t* material)
  : min(std::min(p0.x, p1.x), std::min(p0.y, p1.y), std::min(p0.z, p1.z))
  , max(std::max(p0.x, p1.x), std::max(p0.y, p1.y), std::max(p0.z, p1.z))
{
  sides.add(std::make_unique<rect_t>(rect_t::XY, min.x, max.x, min.y, max.y, max.z, material));
  sides.add(std::make_unique<rect_t>(rect_t::XY, min.x, max.x, min.y, max.y, min.z, material, true));

  sides.add(std::make_unique<rect_t>(rect_t::XZ, min.x, max.x, min.z, max.z, max.y, material));
  sides.add(std::make_unique<rect_t>(rect_t::XZ, min.x, max.x, min.z, max.z, min.y, material, true));

  sides.add(std::make_unique<rect_t>(rect_t::YZ, min.y, max.y, min.z, max.z, max.x, material));
  sides.add(std::make_unique<rect_t>(rect_t::YZ, min.y, max.y, min.z, max.z, min.x, material, true));
}

std::optional<interaction_t> box_t::intersect(
  const ray_t& ray
, float t_min
, float t_max) const
{
  return sides.intersect(ray, t_min, t_max);
}

Imath::Box3f box_t::bounds(float, float) const {
  return aabb::padded(Imath::Box3f(min, max));
}
