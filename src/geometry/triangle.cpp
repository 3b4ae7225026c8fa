#include "triangle.hpp"
#include "math/aabb.hpp"

#include <cmath>

triangle_t::triangle_t(
  const Imath::V3f& v0
, const Imath::V3f& v1
, const Imath::V3f& v2
, const material_t* material)
  : v0(v0), v1(v1), v2(v2), material(material)
{}

std::optional<interaction_t> triangle_t::intersect(
  const ray_t& ray
, float t_min
, float t_max) const
{
  static const float epsilon = 1e-7f;

  const auto e1 = v1 - v0;
  const auto e2 = v2 - v0;

  const auto h = ray.wi.cross(e2);
  const auto a = e1.dot(h);

  // parallel to the plane of the triangle, or no area at all
  if (std::fabs(a) < epsilon) {
    return std::nullopt;
  }

  const auto f = 1.0f / a;
  const auto s = ray.p - v0;
  const auto u = f * s.dot(h);
  if (u < 0.0f || u > 1.0f) {
    return std::nullopt;
  }

  const auto q = s.cross(e1);
  const auto v = f * ray.wi.dot(q);
  if (v < 0.0f || u + v > 1.0f) {
    return std::nullopt;
  }

  const auto t = f * e2.dot(q);
  if (t < t_min || t > t_max) {
    return std::nullopt;
  }

  interaction_t hit;
  hit.t  = t;
  hit.p  = ray.at(t);
  hit.st = Imath::V2f(u, v);
  hit.material = material;
  hit.set_face_normal(ray, e1.cross(e2).normalized());

  return hit;
}

Imath::Box3f triangle_t::bounds(float, float) const {
  Imath::Box3f out(v0);
  out.extendBy(v1);
  out.extendBy(v2);
  return aabb::padded(out);
}
