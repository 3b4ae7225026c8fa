#include <gtest/gtest.h>

#include "material.hpp"
#include "sampling.hpp"
#include "texture.hpp"
#include "math/vector.hpp"

#include <cmath>
#include <memory>
#include <stdexcept>

namespace {
  /* a hit on the plane y=0, seen from above */
  interaction_t floor_hit() {
    interaction_t hit;
    hit.p = Imath::V3f(0.0f);
    hit.n = Imath::V3f(0.0f, 1.0f, 0.0f);
    hit.t = 1.0f;
    hit.front_face = true;
    return hit;
  }
}

TEST(lambert, scatters_into_the_hemisphere) {
  std::unique_ptr<texture_t> albedo(texture_t::make_solid(Imath::Color3f(0.2f, 0.4f, 0.6f)));
  std::unique_ptr<material_t> material(material_t::make_lambert(albedo.get()));

  sampler_t sampler(1);
  ray_t ray(Imath::V3f(0.0f, 1.0f, -1.0f), Imath::V3f(0.0f, -1.0f, 1.0f), 0.25f);

  auto mean_cos = 0.0f;
  const auto n = 10000;

  for (auto i=0; i<n; ++i) {
    const auto s = material->scatter(ray, floor_hit(), sampler);
    ASSERT_TRUE(s);
    EXPECT_EQ(s->attenuation, Imath::Color3f(0.2f, 0.4f, 0.6f));
    EXPECT_GE(s->ray.wi.y, 0.0f);
    EXPECT_EQ(s->ray.time, 0.25f);
    mean_cos += s->ray.wi.normalized().y;
  }

  // cosine weighted directions average to 2/3
  EXPECT_NEAR(mean_cos / n, 2.0f / 3.0f, 0.02f);
}

TEST(metal, mirrors_without_fuzz) {
  std::unique_ptr<material_t> material(material_t::make_metal(Imath::Color3f(0.9f), 0.0f));

  sampler_t sampler(1);
  ray_t ray(Imath::V3f(-1.0f, 1.0f, 0.0f), Imath::V3f(1.0f, -1.0f, 0.0f));

  const auto s = material->scatter(ray, floor_hit(), sampler);
  ASSERT_TRUE(s);
  EXPECT_EQ(s->attenuation, Imath::Color3f(0.9f));

  const auto expected = Imath::V3f(1.0f, 1.0f, 0.0f).normalized();
  EXPECT_NEAR((s->ray.wi.normalized() - expected).length(), 0.0f, 1e-5f);
}

TEST(metal, fuzz_is_clamped) {
  std::unique_ptr<material_t> material(material_t::make_metal(Imath::Color3f(0.9f), 5.0f));

  sampler_t sampler(1);
  ray_t ray(Imath::V3f(-1.0f, 1.0f, 0.0f), Imath::V3f(1.0f, -1.0f, 0.0f));

  for (auto i=0; i<1000; ++i) {
    const auto s = material->scatter(ray, floor_hit(), sampler);
    if (s) {
      const auto mirror = Imath::V3f(1.0f, 1.0f, 0.0f).normalized();
      EXPECT_LE((s->ray.wi - mirror).length(), 1.0f + 1e-5f);
    }
  }
}

TEST(metal, grazing_fuzzy_reflections_get_absorbed) {
  std::unique_ptr<material_t> material(material_t::make_metal(Imath::Color3f(0.9f), 1.0f));

  sampler_t sampler(2);
  ray_t ray(Imath::V3f(-1.0f, 0.01f, 0.0f), Imath::V3f(1.0f, -0.01f, 0.0f));

  auto absorbed = 0;
  for (auto i=0; i<1000; ++i) {
    const auto s = material->scatter(ray, floor_hit(), sampler);
    if (!s) {
      absorbed++;
      continue;
    }
    EXPECT_GT(s->ray.wi.dot(Imath::V3f(0.0f, 1.0f, 0.0f)), 0.0f);
  }

  EXPECT_GT(absorbed, 0);
  EXPECT_LT(absorbed, 1000);
}

TEST(dielectric, never_attenuates) {
  std::unique_ptr<material_t> material(material_t::make_dielectric(1.5f));

  sampler_t sampler(3);
  ray_t ray(Imath::V3f(0.0f, 1.0f, 0.0f), Imath::V3f(0.3f, -1.0f, 0.0f));

  for (auto i=0; i<100; ++i) {
    const auto s = material->scatter(ray, floor_hit(), sampler);
    ASSERT_TRUE(s);
    EXPECT_EQ(s->attenuation, Imath::Color3f(1.0f));
  }
}

TEST(dielectric, reflectance_at_normal_incidence) {
  std::unique_ptr<material_t> material(material_t::make_dielectric(1.5f));

  sampler_t sampler(4);
  ray_t ray(Imath::V3f(0.0f, 1.0f, 0.0f), Imath::V3f(0.0f, -1.0f, 0.0f));

  auto reflected = 0;
  const auto n = 20000;

  for (auto i=0; i<n; ++i) {
    const auto s = material->scatter(ray, floor_hit(), sampler);
    ASSERT_TRUE(s);
    if (s->ray.wi.y > 0.0f) {
      reflected++;
    }
    else {
      EXPECT_NEAR(s->ray.wi.normalized().y, -1.0f, 1e-5f);
    }
  }

  // ((1 - 1.5) / (1 + 1.5))^2
  EXPECT_NEAR((float) reflected / n, 0.04f, 0.01f);
}

TEST(dielectric, total_internal_reflection) {
  std::unique_ptr<material_t> material(material_t::make_dielectric(1.5f));

  // leaving the glass at a grazing angle, past the critical angle
  auto hit = floor_hit();
  hit.front_face = false;

  sampler_t sampler(5);
  ray_t ray(Imath::V3f(-1.0f, 0.2f, 0.0f), Imath::V3f(1.0f, -0.2f, 0.0f));

  const auto expected = reflect(ray.wi.normalized(), hit.n);
  for (auto i=0; i<100; ++i) {
    const auto s = material->scatter(ray, hit, sampler);
    ASSERT_TRUE(s);
    EXPECT_NEAR((s->ray.wi - expected).length(), 0.0f, 1e-5f);
  }
}

TEST(dielectric, refraction_bends_towards_the_normal) {
  std::unique_ptr<material_t> material(material_t::make_dielectric(1.5f));

  sampler_t sampler(6);
  const auto d = Imath::V3f(1.0f, -1.0f, 0.0f).normalized();
  ray_t ray(Imath::V3f(-1.0f, 1.0f, 0.0f), d);

  auto refracted = 0;
  for (auto i=0; i<200; ++i) {
    const auto s = material->scatter(ray, floor_hit(), sampler);
    ASSERT_TRUE(s);
    if (s->ray.wi.y < 0.0f) {
      refracted++;
      // snell's law, sin(45) / 1.5
      const auto w = s->ray.wi.normalized();
      EXPECT_NEAR(w.x, std::sin((float) M_PI / 4.0f) / 1.5f, 1e-4f);
    }
  }
  EXPECT_GT(refracted, 0);
}

TEST(dielectric, requires_positive_index) {
  EXPECT_THROW(material_t::make_dielectric(0.0f), std::invalid_argument);
  EXPECT_THROW(material_t::make_dielectric(-1.5f), std::invalid_argument);
}

TEST(isotropic, scatters_uniformly) {
  std::unique_ptr<texture_t> albedo(texture_t::make_solid(Imath::Color3f(0.5f)));
  std::unique_ptr<material_t> material(material_t::make_isotropic(albedo.get()));

  sampler_t sampler(7);
  ray_t ray(Imath::V3f(0.0f, 1.0f, 0.0f), Imath::V3f(0.0f, -1.0f, 0.0f));

  Imath::V3f mean(0.0f);
  const auto n = 20000;

  for (auto i=0; i<n; ++i) {
    const auto s = material->scatter(ray, floor_hit(), sampler);
    ASSERT_TRUE(s);
    EXPECT_EQ(s->attenuation, Imath::Color3f(0.5f));
    EXPECT_NEAR(s->ray.wi.length(), 1.0f, 1e-4f);
    mean += s->ray.wi;
  }

  mean /= (float) n;
  EXPECT_LT(mean.length(), 0.03f);
}

TEST(diffuse_light, emits_and_never_scatters) {
  std::unique_ptr<texture_t> emission(texture_t::make_solid(Imath::Color3f(4.0f)));
  std::unique_ptr<material_t> light(material_t::make_diffuse_light(emission.get()));

  sampler_t sampler(8);
  ray_t ray(Imath::V3f(0.0f, 1.0f, 0.0f), Imath::V3f(0.0f, -1.0f, 0.0f));

  EXPECT_TRUE(light->is_emitter());
  EXPECT_FALSE(light->scatter(ray, floor_hit(), sampler));
  EXPECT_EQ(light->emitted(Imath::V2f(0.0f), Imath::V3f(0.0f)), Imath::Color3f(4.0f));
}

TEST(materials, only_lights_emit) {
  std::unique_ptr<texture_t> albedo(texture_t::make_solid(Imath::Color3f(0.5f)));
  std::unique_ptr<material_t> lambert(material_t::make_lambert(albedo.get()));
  std::unique_ptr<material_t> metal(material_t::make_metal(Imath::Color3f(0.5f), 0.1f));
  std::unique_ptr<material_t> glass(material_t::make_dielectric(1.5f));

  EXPECT_EQ(lambert->emitted(Imath::V2f(0.0f), Imath::V3f(0.0f)), Imath::Color3f(0.0f));
  EXPECT_EQ(metal->emitted(Imath::V2f(0.0f), Imath::V3f(0.0f)), Imath::Color3f(0.0f));
  EXPECT_EQ(glass->emitted(Imath::V2f(0.0f), Imath::V3f(0.0f)), Imath::Color3f(0.0f));
  EXPECT_FALSE(lambert->is_emitter());
}

TEST(materials, require_textures) {
  EXPECT_THROW(material_t::make_lambert(nullptr), std::invalid_argument);
  EXPECT_THROW(material_t::make_isotropic(nullptr), std::invalid_argument);
  EXPECT_THROW(material_t::make_diffuse_light(nullptr), std::invalid_argument);
}
