#include "sphere.hpp"
#include "math/trigonometry.hpp"

#include <algorithm>
#include <cmath>

namespace sphere {
  Imath::V2f st(const Imath::V3f& n) {
    const auto theta = std::acos(std::clamp(-n.y, -1.0f, 1.0f));
    const auto phi   = std::atan2(-n.z, n.x) + trig::PI;

    return Imath::V2f(phi * trig::INV_TWO_PI, theta * trig::INV_PI);
  }

  std::optional<interaction_t> intersect(
    const Imath::V3f& center
  , float radius
  , const material_t* material
  , const ray_t& ray
  , float t_min
  , float t_max)
  {
    if (!(radius > 0.0f) || ray.is_degenerate()) {
      return std::nullopt;
    }

    const auto oc     = ray.p - center;
    const auto a      = ray.wi.length2();
    const auto half_b = oc.dot(ray.wi);
    const auto c      = oc.length2() - radius * radius;

    const auto discriminant = half_b * half_b - a * c;
    if (discriminant < 0.0f) {
      return std::nullopt;
    }

    const auto sqrtd = std::sqrt(discriminant);

    auto root = (-half_b - sqrtd) / a;
    if (root < t_min || t_max < root) {
      root = (-half_b + sqrtd) / a;
      if (root < t_min || t_max < root) {
        return std::nullopt;
      }
    }

    interaction_t hit;
    hit.t = root;
    hit.p = ray.at(root);
    hit.material = material;

    const auto outward = (hit.p - center) / radius;
    hit.set_face_normal(ray, outward);
    hit.st = st(outward);

    return hit;
  }
}

sphere_t::sphere_t(const Imath::V3f& center, float radius, const material_t* material)
  : center(center), radius(radius), material(material)
{}

std::optional<interaction_t> sphere_t::intersect(
  const ray_t& ray
, float t_min
, float t_max) const
{
  return sphere::intersect(center, radius, material, ray, t_min, t_max);
}

Imath::Box3f sphere_t::bounds(float, float) const {
  if (!(radius > 0.0f)) {
    return Imath::Box3f();
  }
  const Imath::V3f r(radius);
  return Imath::Box3f(center - r, center + r);
}

moving_sphere_t::moving_sphere_t(
  const Imath::V3f& center0
, const Imath::V3f& center1
, float time0
, float time1
, float radius
, const material_t* material)
  : center0(center0)
  , center1(center1)
  , time0(time0)
  , time1(time1)
  , radius(radius)
  , material(material)
{}

Imath::V3f moving_sphere_t::center(float time) const {
  if (time1 == time0) {
    return center0;
  }
  const auto s = (time - time0) / (time1 - time0);
  return (1.0f - s) * center0 + s * center1;
}

std::optional<interaction_t> moving_sphere_t::intersect(
  const ray_t& ray
, float t_min
, float t_max) const
{
  return sphere::intersect(center(ray.time), radius, material, ray, t_min, t_max);
}

Imath::Box3f moving_sphere_t::bounds(float t0, float t1) const {
  if (!(radius > 0.0f)) {
    return Imath::Box3f();
  }
  const Imath::V3f r(radius);

  const auto c0 = center(t0);
  const auto c1 = center(t1);

  Imath::Box3f out(c0 - r, c0 + r);
  out.extendBy(Imath::Box3f(c1 - r, c1 + r));
  return out;
}
