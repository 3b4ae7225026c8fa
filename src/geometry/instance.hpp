#pragma once

#include "primitive.hpp"

#include <ImathMatrix.h>
#include <ImathVec.h>

/**
 * Places a primitive in the scene through an affine transform. Rays
 * are moved into the local space of the primitive, hits are moved back.
 * An instance with a singular transform is never hit
 */
struct instance_t : public primitive_t {
  primitive_t::scoped_t primitive;

  Imath::M44f to_world;
  Imath::M44f to_local;

  bool singular;

  instance_t(primitive_t::scoped_t primitive, const Imath::M44f& to_world);

  std::optional<interaction_t> intersect(
    const ray_t& ray
  , float t_min
  , float t_max) const override;

  Imath::Box3f bounds(float time0, float time1) const override;
};

namespace transform {
  Imath::M44f translate(const Imath::V3f& offset);

  /* rotation about 'axis' by 'degrees' */
  Imath::M44f rotate(const Imath::V3f& axis, float degrees);

  Imath::M44f scale(const Imath::V3f& s);

  /* determinant of the linear part of an affine transform */
  float determinant(const Imath::M44f& m);
}
