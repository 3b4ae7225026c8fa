#pragma once

#include "state.hpp"

#include <ImathBox.h>

#include <memory>
#include <optional>
#include <vector>

/**
 * Anything a ray can be intersected with. Implementations report the
 * closest hit with a parametric distance in [t_min, t_max], and a box
 * that bounds them over the time interval [time0, time1]. Primitives
 * are immutable once built, and may be shared by all render threads
 */
struct primitive_t {
  typedef std::unique_ptr<primitive_t> scoped_t;

  virtual ~primitive_t()
  {}

  virtual std::optional<interaction_t> intersect(
    const ray_t& ray
  , float t_min
  , float t_max) const = 0;

  virtual Imath::Box3f bounds(float time0, float time1) const = 0;
};

typedef std::vector<primitive_t::scoped_t> primitives_t;
