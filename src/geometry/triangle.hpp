#pragma once

#include "primitive.hpp"

#include <ImathVec.h>

/* single triangle, intersected with the moeller trumbore algorithm.
 * barycentric coordinates are reported as surface coordinates */
struct triangle_t : public primitive_t {
  Imath::V3f v0, v1, v2;

  const material_t* material;

  triangle_t(
    const Imath::V3f& v0
  , const Imath::V3f& v1
  , const Imath::V3f& v2
  , const material_t* material);

  std::optional<interaction_t> intersect(
    const ray_t& ray
  , float t_min
  , float t_max) const override;

  Imath::Box3f bounds(float time0, float time1) const override;
};
