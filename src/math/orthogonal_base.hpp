#pragma once

#include <ImathVec.h>

#include <cmath>

/* orthonormal frame around a unit normal, which becomes the y axis of the
 * local coordinate system. tangents follow Duff et al. 2017 */
struct orthogonal_base_t {
  Imath::V3f tangent, normal, bitangent;

  explicit orthogonal_base_t(const Imath::V3f& n)
    : normal(n)
  {
    const float sign = std::copysign(1.0f, n.z);
    const float a    = -1.0f / (sign + n.z);
    const float b    = n.x * n.y * a;

    tangent   = Imath::V3f(1.0f + sign * n.x * n.x * a, sign * b, -sign * n.x);
    bitangent = Imath::V3f(b, sign + n.y * n.y * a, -n.y);
  }

  inline Imath::V3f to_world(const Imath::V3f& v) const {
    return v.x * tangent + v.y * normal + v.z * bitangent;
  }
};
