#include "rect.hpp"
#include "math/aabb.hpp"

#include <algorithm>

void rect_t::axes(plane_t plane, int& a, int& b, int& n) {
  switch (plane) {
    case XY: a = 0; b = 1; n = 2; break;
    case XZ: a = 0; b = 2; n = 1; break;
    case YZ: a = 1; b = 2; n = 0; break;
  }
}

rect_t::rect_t(
  plane_t plane
, float a0, float a1
, float b0, float b1
, float k
, const material_t* material
, bool flipped)
  : plane(plane)
  , a0(std::min(a0, a1)), a1(std::max(a0, a1))
  , b0(std::min(b0, b1)), b1(std::max(b0, b1))
  , k(k)
  , material(material)
  , flipped(flipped)
{}

std::optional<interaction_t> rect_t::intersect(
  const ray_t& ray
, float t_min
, float t_max) const
{
  if (is_degenerate()) {
    return std::nullopt;
  }

  int a, b, n;
  axes(plane, a, b, n);

  if (ray.wi[n] == 0.0f) {
    return std::nullopt;
  }

  const auto t = (k - ray.p[n]) / ray.wi[n];
  if (t < t_min || t > t_max) {
    return std::nullopt;
  }

  const auto x = ray.p[a] + t * ray.wi[a];
  const auto y = ray.p[b] + t * ray.wi[b];
  if (x < a0 || x > a1 || y < b0 || y > b1) {
    return std::nullopt;
  }

  Imath::V3f outward(0.0f);
  outward[n] = flipped ? -1.0f : 1.0f;

  interaction_t hit;
  hit.t  = t;
  hit.p  = ray.at(t);
  hit.p[n] = k;
  hit.st = Imath::V2f((x - a0) / (a1 - a0), (y - b0) / (b1 - b0));
  hit.material = material;
  hit.set_face_normal(ray, outward);

  return hit;
}

Imath::Box3f rect_t::bounds(float, float) const {
  if (is_degenerate()) {
    return Imath::Box3f();
  }

  int a, b, n;
  axes(plane, a, b, n);

  Imath::V3f min, max;
  min[a] = a0; max[a] = a1;
  min[b] = b0; max[b] = b1;
  min[n] = k;  max[n] = k;

  return aabb::padded(Imath::Box3f(min, max));
}
