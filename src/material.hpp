#pragma once

#include "state.hpp"

#include <ImathColor.h>

#include <optional>

struct sampler_t;
struct texture_t;

/* outcome of a scattering event at a surface or inside a medium */
struct scatter_t {
  Imath::Color3f attenuation;
  ray_t          ray;
};

/**
 * Materials decide what happens to a ray at a hit point. Scattering
 * returns the attenuation and the continuation ray, or nothing if the
 * ray is absorbed. Textures are referenced, not owned
 */
struct material_t {
  enum type_t {
    LAMBERT, // ideal diffuse reflector
    METAL, // mirror reflection, optionally blurred by a fuzz factor
    DIELECTRIC, // glass like refraction and fresnel reflection
    ISOTROPIC, // phase function of a participating medium
    DIFFUSE_LIGHT // emitter, never scatters
  } type;

  struct details_t {
    virtual ~details_t()
    {}
  } *details;

  uint32_t id;

  material_t(type_t type, details_t* details);
  ~material_t();

  material_t(const material_t&) = delete;
  material_t& operator=(const material_t&) = delete;

  std::optional<scatter_t> scatter(
    const ray_t& ray
  , const interaction_t& hit
  , sampler_t& sampler) const;

  /* radiance emitted at a point, black for everything but lights */
  Imath::Color3f emitted(const Imath::V2f& st, const Imath::V3f& p) const;

  inline bool is_emitter() const {
    return type == DIFFUSE_LIGHT;
  }

  static material_t* make_lambert(const texture_t* albedo);

  /* 'fuzz' is clamped to 1 */
  static material_t* make_metal(const Imath::Color3f& albedo, float fuzz);

  static material_t* make_dielectric(float ior);

  static material_t* make_isotropic(const texture_t* albedo);

  static material_t* make_diffuse_light(const texture_t* emission);
};
