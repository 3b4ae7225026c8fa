#pragma once

#include "primitive.hpp"

/**
 * Participating medium of constant density inside a closed, convex
 * boundary. A ray crossing the boundary scatters after a free flight
 * distance drawn from an exponential distribution, or passes through
 * if that distance lies beyond the exit point. The random number for
 * the flight is derived from the seed of the ray, and the density and
 * bounds of the medium, so the result only depends on the ray and the
 * scene contents
 */
struct constant_medium_t : public primitive_t {
  primitive_t::scoped_t boundary;

  float density;
  float neg_inv_density;

  // the isotropic phase function reported on scattering events
  const material_t* phase;

  uint64_t salt;

  constant_medium_t(
    primitive_t::scoped_t boundary
  , float density
  , const material_t* phase);

  std::optional<interaction_t> intersect(
    const ray_t& ray
  , float t_min
  , float t_max) const override;

  Imath::Box3f bounds(float time0, float time1) const override;

  /* uniform number in (0, 1] for the flight of a ray through this medium */
  float xi(const ray_t& ray) const;
};
