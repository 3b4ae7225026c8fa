#pragma once

#include "primitive.hpp"
#include "accel/list.hpp"

#include <ImathVec.h>

/* axis aligned box spanning [min, max], made of six rectangles */
struct box_t : public primitive_t {
  Imath::V3f min, max;

  accel::list_t sides;

  box_t(const Imath::V3f& p0, const Imath::V3f& p1, const material_t* material);

  std::optional<interaction_t> intersect(
    const ray_t& ray
  , float t_min
  , float t_max) const override;

  Imath::Box3f bounds(float time0, float time1) const override;
};
