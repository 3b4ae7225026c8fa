#pragma once

#include "primitive.hpp"

#include <ImathVec.h>

struct sphere_t : public primitive_t {
  Imath::V3f center;
  float radius;
  const material_t* material;

  sphere_t(const Imath::V3f& center, float radius, const material_t* material);

  std::optional<interaction_t> intersect(
    const ray_t& ray
  , float t_min
  , float t_max) const override;

  Imath::Box3f bounds(float time0, float time1) const override;
};

/* a sphere moving linearly from 'center0' at 'time0' to 'center1'
 * at 'time1' */
struct moving_sphere_t : public primitive_t {
  Imath::V3f center0, center1;
  float time0, time1;
  float radius;
  const material_t* material;

  moving_sphere_t(
    const Imath::V3f& center0
  , const Imath::V3f& center1
  , float time0
  , float time1
  , float radius
  , const material_t* material);

  /* the center at a point in time, exact at both ends of the interval */
  Imath::V3f center(float time) const;

  std::optional<interaction_t> intersect(
    const ray_t& ray
  , float t_min
  , float t_max) const override;

  Imath::Box3f bounds(float time0, float time1) const override;
};

namespace sphere {
  /* surface coordinates of a point on the unit sphere. u is the angle
   * around the y axis starting at x=-1, v the angle from y=-1 to y=1 */
  Imath::V2f st(const Imath::V3f& n);

  /* closest root of the ray/sphere quadratic inside [t_min, t_max] */
  std::optional<interaction_t> intersect(
    const Imath::V3f& center
  , float radius
  , const material_t* material
  , const ray_t& ray
  , float t_min
  , float t_max);
}
