#include "instance.hpp"
#include "math/trigonometry.hpp"

#include <ImathBoxAlgo.h>

#include <cmath>
#include <stdexcept>

namespace transform {
  Imath::M44f translate(const Imath::V3f& offset) {
    Imath::M44f out;
    out.setTranslation(offset);
    return out;
  }

  Imath::M44f rotate(const Imath::V3f& axis, float degrees) {
    Imath::M44f out;
    out.setAxisAngle(axis.normalized(), trig::radians(degrees));
    return out;
  }

  Imath::M44f scale(const Imath::V3f& s) {
    Imath::M44f out;
    out.setScale(s);
    return out;
  }

  float determinant(const Imath::M44f& m) {
    return
        m[0][0] * (m[1][1] * m[2][2] - m[1][2] * m[2][1])
      - m[0][1] * (m[1][0] * m[2][2] - m[1][2] * m[2][0])
      + m[0][2] * (m[1][0] * m[2][1] - m[1][1] * m[2][0]);
  }
}

instance_t::instance_t(primitive_t::scoped_t primitive, const Imath::M44f& to_world)
  : primitive(std::move(primitive))
  , to_world(to_world)
  , singular(std::fabs(transform::determinant(to_world)) < 1e-12f)
{
  if (!this->primitive) {
    throw std::invalid_argument("instance requires a primitive");
  }
  if (!singular) {
    to_local = to_world.inverse();
  }
}

std::optional<interaction_t> instance_t::intersect(
  const ray_t& ray
, float t_min
, float t_max) const
{
  if (singular || ray.is_degenerate()) {
    return std::nullopt;
  }

  // affine maps keep the parametric distance along the ray intact
  ray_t local(ray);
  to_local.multVecMatrix(ray.p, local.p);
  to_local.multDirMatrix(ray.wi, local.wi);

  auto hit = primitive->intersect(local, t_min, t_max);
  if (!hit) {
    return std::nullopt;
  }

  Imath::V3f p;
  to_world.multVecMatrix(hit->p, p);

  // normals transform with the inverse transpose
  const auto outward_local = hit->front_face ? hit->n : -hit->n;

  Imath::V3f outward;
  to_local.transposed().multDirMatrix(outward_local, outward);
  outward.normalize();

  hit->p = p;
  hit->set_face_normal(ray, outward);

  return hit;
}

Imath::Box3f instance_t::bounds(float time0, float time1) const {
  if (singular) {
    return Imath::Box3f();
  }
  return Imath::transform(primitive->bounds(time0, time1), to_world);
}
