#pragma once

#include "options.hpp"
#include "primitive.hpp"
#include "entities/camera.hpp"

#include <ImathColor.h>

#include <optional>
#include <string>

struct material_t;
struct predictor_t;
struct texture_t;

/* radiance arriving along rays that leave the scene */
struct background_t {
  enum type_t {
    SOLID, // the same color in every direction
    GRADIENT // blends from bottom to top with the height of the direction
  } type;

  Imath::Color3f bottom;
  Imath::Color3f top;

  inline background_t()
    : type(SOLID), bottom(0.0f), top(0.0f)
  {}

  inline Imath::Color3f value(const ray_t& ray) const {
    if (type == SOLID) {
      return top;
    }
    const auto d = ray.wi.normalized();
    const auto t = 0.5f * (d.y + 1.0f);
    return (1.0f - t) * bottom + t * top;
  }

  static inline background_t make_solid(const Imath::Color3f& color) {
    background_t out;
    out.type   = SOLID;
    out.bottom = color;
    out.top    = color;
    return out;
  }

  static inline background_t make_gradient(const Imath::Color3f& bottom, const Imath::Color3f& top) {
    background_t out;
    out.type   = GRADIENT;
    out.bottom = bottom;
    out.top    = top;
    return out;
  }
};

/**
 * Owns everything that is rendered: named textures and materials, the
 * primitives, the camera and the background. The scene is filled in,
 * then preprocessed into a root accelerator, and is read only while
 * rendering
 */
struct scene_t {
  struct details_t;

  details_t* details;

  camera_t camera;

  background_t background;

  scene_t();
  ~scene_t();

  scene_t(const scene_t&) = delete;
  scene_t& operator=(const scene_t&) = delete;

  void reset();

  /* build the root accelerator over all primitives added so far */
  void preprocess(render_config_t::accel_t accel = render_config_t::BVH);

  /* the scene takes ownership of textures, materials and primitives.
   * adding a name twice throws std::runtime_error */
  texture_t* add(const std::string& name, texture_t* texture);
  material_t* add(const std::string& name, material_t* material);

  void add(primitive_t::scoped_t primitive);

  uint32_t num_textures() const;
  uint32_t num_materials() const;
  uint32_t num_primitives() const;

  texture_t* texture(const std::string& name) const;
  material_t* material(const std::string& name) const;

  /* closest hit in [t_min, t_max]. the predictor only orders bvh
   * traversal, and may be null */
  std::optional<interaction_t> intersect(
    const ray_t& ray
  , float t_min
  , float t_max
  , predictor_t* predictor = nullptr) const;

  Imath::Box3f bounds() const;
};
