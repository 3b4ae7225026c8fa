#pragma once

#include <ImathVec.h>

#include <cstdint>
#include <limits>

struct material_t;
struct film_t;
struct predictor_t;

namespace job {
  struct tiles_t;
}

/* Global state for the rendering of one frame */
struct frame_state_t {
  job::tiles_t* tiles;
  film_t*       film;
  // optional traversal predictor shared by all workers, may be null
  predictor_t*  predictor;

  inline frame_state_t(job::tiles_t* tiles, film_t* film, predictor_t* predictor = nullptr)
    : tiles(tiles)
    , film(film)
    , predictor(predictor)
  {}

  frame_state_t(const frame_state_t&) = delete;
  frame_state_t& operator=(const frame_state_t&) = delete;
};

/* Models a ray as it travels through the scene. The direction is not
 * required to be normalized, distances along the ray are measured in
 * units of its length */
struct ray_t {
  Imath::V3f p;
  Imath::V3f wi;
  // point in the shutter interval at which the ray exists
  float time;
  // random stream for stochastic primitives, like participating media.
  // drawn by the sampler that spawned the ray
  uint64_t seed;

  inline ray_t()
    : p(0.0f), wi(0.0f), time(0.0f), seed(0)
  {}

  inline ray_t(
    const Imath::V3f& p
  , const Imath::V3f& wi
  , float time = 0.0f
  , uint64_t seed = 0)
    : p(p), wi(wi), time(time), seed(seed)
  {}

  inline Imath::V3f at(float t) const {
    return p + wi * t;
  }

  /* rays without a direction never intersect anything */
  inline bool is_degenerate() const {
    return wi.length2() == 0.0f;
  }
};

/**
 * A surface interaction models a point on a surface at which
 * a ray has intersected a primitive. It consists of the hitpoint, the
 * parametric distance along the ray, and the surface normal, which is
 * always flipped to face against the incoming ray. front_face records
 * whether the geometric normal already did. It holds the surface
 * coordinates of the hit, and the material found at the point, which is
 * not owned by the interaction
 */
struct interaction_t {
  Imath::V3f p;
  Imath::V3f n;
  Imath::V2f st;
  float t;

  bool front_face;

  const material_t* material;

  // index of the primitive in the arena it was found in
  uint32_t primitive;

  inline interaction_t()
    : p(0.0f)
    , n(0.0f)
    , st(0.0f)
    , t(std::numeric_limits<float>::max())
    , front_face(true)
    , material(nullptr)
    , primitive(std::numeric_limits<uint32_t>::max())
  {}

  /* orient the normal against the ray, expects a normalized outward normal */
  inline void set_face_normal(const ray_t& ray, const Imath::V3f& outward) {
    front_face = ray.wi.dot(outward) < 0.0f;
    n = front_face ? outward : -outward;
  }
};
