#pragma once

#include <ImathVec.h>

#include <algorithm>
#include <cmath>

/* true if all components are close to zero. scattering into such a
 * direction would produce a degenerate ray */
inline bool near_zero(const Imath::V3f& v) {
  static const float eps = 1e-8f;
  return std::fabs(v.x) < eps && std::fabs(v.y) < eps && std::fabs(v.z) < eps;
}

/* mirror 'v' about the normal 'n' */
inline Imath::V3f reflect(const Imath::V3f& v, const Imath::V3f& n) {
  return v - 2.0f * v.dot(n) * n;
}

/* refract the unit vector 'uv' through a surface with normal 'n', where
 * 'eta' is the ratio of the refractive indices on both sides */
inline Imath::V3f refract(const Imath::V3f& uv, const Imath::V3f& n, float eta) {
  const auto cos_theta = std::min(-uv.dot(n), 1.0f);
  const auto perpendicular = eta * (uv + cos_theta * n);
  const auto parallel = -std::sqrt(std::fabs(1.0f - perpendicular.length2())) * n;
  return perpendicular + parallel;
}
