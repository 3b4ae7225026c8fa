#include "material.hpp"
#include "sampling.hpp"
#include "texture.hpp"
#include "math/fresnel.hpp"
#include "math/orthogonal_base.hpp"
#include "math/sampling.hpp"
#include "math/vector.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {
  struct lambert_material_t : public material_t::details_t {
    const texture_t* albedo;

    lambert_material_t(const texture_t* albedo)
      : albedo(albedo)
    {}

    std::optional<scatter_t> scatter(
      const ray_t& ray
    , const interaction_t& hit
    , sampler_t& sampler) const
    {
      Imath::V3f local;
      float pdf;
      sample::hemisphere::cosine_weighted(sampler.sample2(), local, pdf);

      auto wo = orthogonal_base_t(hit.n).to_world(local);
      if (near_zero(wo)) {
        wo = hit.n;
      }

      return scatter_t{
        albedo->value(hit.st, hit.p)
      , ray_t(hit.p, wo, ray.time, sampler.next_seed())
      };
    }
  };

  struct metal_material_t : public material_t::details_t {
    Imath::Color3f albedo;
    float fuzz;

    metal_material_t(const Imath::Color3f& albedo, float fuzz)
      : albedo(albedo), fuzz(std::clamp(fuzz, 0.0f, 1.0f))
    {}

    std::optional<scatter_t> scatter(
      const ray_t& ray
    , const interaction_t& hit
    , sampler_t& sampler) const
    {
      auto wo = reflect(ray.wi.normalized(), hit.n);
      if (fuzz > 0.0f) {
        const auto uv = sampler.sample2();
        wo += fuzz * sample::sphere::inside(uv, sampler.sample());
      }

      if (wo.dot(hit.n) <= 0.0f) {
        return std::nullopt;
      }

      return scatter_t{
        albedo
      , ray_t(hit.p, wo, ray.time, sampler.next_seed())
      };
    }
  };

  struct dielectric_material_t : public material_t::details_t {
    float ior;

    dielectric_material_t(float ior)
      : ior(ior)
    {}

    std::optional<scatter_t> scatter(
      const ray_t& ray
    , const interaction_t& hit
    , sampler_t& sampler) const
    {
      const auto eta = hit.front_face ? 1.0f / ior : ior;
      const auto d = ray.wi.normalized();

      const auto cos_theta = std::min(-d.dot(hit.n), 1.0f);
      const auto sin_theta = std::sqrt(std::max(0.0f, 1.0f - cos_theta * cos_theta));

      const auto cannot_refract = eta * sin_theta > 1.0f;

      Imath::V3f wo;
      if (cannot_refract || fresnel::schlick(cos_theta, eta) > sampler.sample()) {
        wo = reflect(d, hit.n);
      }
      else {
        wo = refract(d, hit.n, eta);
      }

      return scatter_t{
        Imath::Color3f(1.0f)
      , ray_t(hit.p, wo, ray.time, sampler.next_seed())
      };
    }
  };

  struct isotropic_material_t : public material_t::details_t {
    const texture_t* albedo;

    isotropic_material_t(const texture_t* albedo)
      : albedo(albedo)
    {}

    std::optional<scatter_t> scatter(
      const ray_t& ray
    , const interaction_t& hit
    , sampler_t& sampler) const
    {
      const auto wo = sample::sphere::uniform(sampler.sample2());

      return scatter_t{
        albedo->value(hit.st, hit.p)
      , ray_t(hit.p, wo, ray.time, sampler.next_seed())
      };
    }
  };

  struct diffuse_light_material_t : public material_t::details_t {
    const texture_t* emission;

    diffuse_light_material_t(const texture_t* emission)
      : emission(emission)
    {}
  };

  template<typename T>
  inline const T* checked(const T* texture, const char* what) {
    if (!texture) {
      throw std::invalid_argument(what);
    }
    return texture;
  }
}

material_t::material_t(type_t type, details_t* details)
  : type(type), details(details), id(0)
{}

material_t::~material_t() {
  delete details;
}

std::optional<scatter_t> material_t::scatter(
  const ray_t& ray
, const interaction_t& hit
, sampler_t& sampler) const
{
  switch (type) {
    case LAMBERT:
      return static_cast<const lambert_material_t*>(details)->scatter(ray, hit, sampler);
    case METAL:
      return static_cast<const metal_material_t*>(details)->scatter(ray, hit, sampler);
    case DIELECTRIC:
      return static_cast<const dielectric_material_t*>(details)->scatter(ray, hit, sampler);
    case ISOTROPIC:
      return static_cast<const isotropic_material_t*>(details)->scatter(ray, hit, sampler);
    case DIFFUSE_LIGHT:
      return std::nullopt;
  }
  return std::nullopt;
}

Imath::Color3f material_t::emitted(const Imath::V2f& st, const Imath::V3f& p) const {
  if (type == DIFFUSE_LIGHT) {
    return static_cast<const diffuse_light_material_t*>(details)->emission->value(st, p);
  }
  return Imath::Color3f(0.0f);
}

material_t* material_t::make_lambert(const texture_t* albedo) {
  return new material_t(LAMBERT, new lambert_material_t(checked(albedo, "lambert material requires an albedo texture")));
}

material_t* material_t::make_metal(const Imath::Color3f& albedo, float fuzz) {
  return new material_t(METAL, new metal_material_t(albedo, fuzz));
}

material_t* material_t::make_dielectric(float ior) {
  if (!(ior > 0.0f)) {
    throw std::invalid_argument("dielectric material requires a positive index of refraction");
  }
  return new material_t(DIELECTRIC, new dielectric_material_t(ior));
}

material_t* material_t::make_isotropic(const texture_t* albedo) {
  return new material_t(ISOTROPIC, new isotropic_material_t(checked(albedo, "isotropic material requires an albedo texture")));
}

material_t* material_t::make_diffuse_light(const texture_t* emission) {
  return new material_t(DIFFUSE_LIGHT, new diffuse_light_material_t(checked(emission, "diffuse light requires an emission texture")));
}
