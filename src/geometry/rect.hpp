#pragma once

#include "primitive.hpp"

/**
 * Axis aligned rectangle. The rectangle spans [a0, a1] x [b0, b1] on the
 * two axes of its plane, and sits at 'k' on the remaining one. Its
 * outward normal points along the positive remaining axis, unless the
 * rectangle is flipped
 */
struct rect_t : public primitive_t {
  enum plane_t {
    XY,
    XZ,
    YZ
  } plane;

  float a0, a1, b0, b1, k;

  const material_t* material;

  bool flipped;

  rect_t(
    plane_t plane
  , float a0, float a1
  , float b0, float b1
  , float k
  , const material_t* material
  , bool flipped = false);

  std::optional<interaction_t> intersect(
    const ray_t& ray
  , float t_min
  , float t_max) const override;

  Imath::Box3f bounds(float time0, float time1) const override;

  inline bool is_degenerate() const {
    return !(a1 > a0) || !(b1 > b0);
  }

  /* the axes spanned by the plane, and the axis of the normal */
  static void axes(plane_t plane, int& a, int& b, int& n);
};
