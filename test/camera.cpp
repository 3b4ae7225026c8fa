#include <gtest/gtest.h>

#include "sampling.hpp"
#include "entities/camera.hpp"
#include "kernels/cpu/camera.hpp"

#include <cmath>
#include <stdexcept>

namespace {
  bool near(const Imath::V3f& a, const Imath::V3f& b, float eps = 1e-4f) {
    return (a - b).length() < eps;
  }
}

TEST(camera, center_of_image_looks_at_target) {
  const auto camera = camera_t::look_at(
    Imath::V3f(0.0f, 0.0f, 3.0f)
  , Imath::V3f(0.0f)
  , Imath::V3f(0.0f, 1.0f, 0.0f)
  , 40.0f
  , 1.0f);

  sampler_t sampler(1);
  camera::perspective_kernel_t rays;

  const auto ray = rays(camera, 0.5f, 0.5f, sampler);
  EXPECT_TRUE(near(ray.p, Imath::V3f(0.0f, 0.0f, 3.0f)));
  EXPECT_TRUE(near(ray.wi.normalized(), Imath::V3f(0.0f, 0.0f, -1.0f)));
}

TEST(camera, image_axes_follow_up_vector) {
  const auto camera = camera_t::look_at(
    Imath::V3f(0.0f, 0.0f, 3.0f)
  , Imath::V3f(0.0f)
  , Imath::V3f(0.0f, 1.0f, 0.0f)
  , 90.0f
  , 2.0f);

  sampler_t sampler(1);
  camera::perspective_kernel_t rays;

  const auto top_right = rays(camera, 1.0f, 1.0f, sampler);
  EXPECT_GT(top_right.wi.x, 0.0f);
  EXPECT_GT(top_right.wi.y, 0.0f);

  // tan(45) at unit focus distance, twice as wide as high
  EXPECT_NEAR(top_right.wi.y / -top_right.wi.z, 1.0f, 1e-4f);
  EXPECT_NEAR(top_right.wi.x / -top_right.wi.z, 2.0f, 1e-4f);
}

TEST(camera, pinhole_without_motion_is_deterministic) {
  const auto camera = camera_t::look_at(
    Imath::V3f(1.0f, 2.0f, 3.0f)
  , Imath::V3f(0.0f)
  , Imath::V3f(0.0f, 1.0f, 0.0f)
  , 60.0f
  , 1.5f);

  EXPECT_TRUE(camera.is_pinhole());

  sampler_t a(1), b(2);
  camera::perspective_kernel_t rays;

  const auto ra = rays(camera, 0.3f, 0.7f, a);
  const auto rb = rays(camera, 0.3f, 0.7f, b);

  EXPECT_EQ(ra.p, rb.p);
  EXPECT_EQ(ra.wi, rb.wi);
  EXPECT_EQ(ra.time, 0.0f);
  EXPECT_EQ(rb.time, 0.0f);
}

TEST(camera, lens_rays_converge_on_focus_plane) {
  const auto camera = camera_t::look_at(
    Imath::V3f(0.0f, 0.0f, 10.0f)
  , Imath::V3f(0.0f)
  , Imath::V3f(0.0f, 1.0f, 0.0f)
  , 30.0f
  , 1.0f
  , 2.0f
  , 10.0f);

  EXPECT_FALSE(camera.is_pinhole());

  sampler_t sampler(3);
  camera::perspective_kernel_t rays;

  const auto first = rays(camera, 0.25f, 0.6f, sampler);
  auto spread = false;

  for (auto i=0; i<64; ++i) {
    const auto ray = rays(camera, 0.25f, 0.6f, sampler);

    // the origin moves over the lens, the point in focus doesn't
    EXPECT_LE((ray.p - camera.origin).length(), camera.lens_radius + 1e-5f);
    EXPECT_TRUE(near(ray.at(1.0f), first.at(1.0f), 1e-3f));
    EXPECT_NEAR(ray.at(1.0f).z, 0.0f, 1e-3f);

    spread = spread || !near(ray.p, first.p, 1e-3f);
  }
  EXPECT_TRUE(spread);
}

TEST(camera, times_span_the_shutter_interval) {
  const auto camera = camera_t::look_at(
    Imath::V3f(0.0f, 0.0f, 3.0f)
  , Imath::V3f(0.0f)
  , Imath::V3f(0.0f, 1.0f, 0.0f)
  , 40.0f
  , 1.0f
  , 0.0f
  , 3.0f
  , 0.5f
  , 1.5f);

  sampler_t sampler(5);
  camera::perspective_kernel_t rays;

  auto lo = 2.0f, hi = 0.0f, sum = 0.0f;
  const auto n = 4000;

  for (auto i=0; i<n; ++i) {
    const auto t = rays(camera, 0.5f, 0.5f, sampler).time;
    EXPECT_GE(t, 0.5f);
    EXPECT_LE(t, 1.5f);
    lo = std::min(lo, t);
    hi = std::max(hi, t);
    sum += t;
  }

  EXPECT_LT(lo, 0.55f);
  EXPECT_GT(hi, 1.45f);
  EXPECT_NEAR(sum / n, 1.0f, 0.05f);
}

TEST(camera, rays_carry_fresh_seeds) {
  const auto camera = camera_t::look_at(
    Imath::V3f(0.0f, 0.0f, 3.0f)
  , Imath::V3f(0.0f)
  , Imath::V3f(0.0f, 1.0f, 0.0f)
  , 40.0f
  , 1.0f);

  sampler_t sampler(5);
  camera::perspective_kernel_t rays;

  EXPECT_NE(rays(camera, 0.5f, 0.5f, sampler).seed, rays(camera, 0.5f, 0.5f, sampler).seed);
}

TEST(camera, rejects_invalid_settings) {
  const Imath::V3f from(0.0f, 0.0f, 3.0f), at(0.0f), up(0.0f, 1.0f, 0.0f);

  EXPECT_THROW(camera_t::look_at(from, at, up, 0.0f, 1.0f), std::invalid_argument);
  EXPECT_THROW(camera_t::look_at(from, at, up, 180.0f, 1.0f), std::invalid_argument);
  EXPECT_THROW(camera_t::look_at(from, at, up, 40.0f, 0.0f), std::invalid_argument);
  EXPECT_THROW(camera_t::look_at(from, at, up, 40.0f, 1.0f, -1.0f), std::invalid_argument);
  EXPECT_THROW(camera_t::look_at(from, at, up, 40.0f, 1.0f, 0.0f, 0.0f), std::invalid_argument);
  EXPECT_THROW(camera_t::look_at(from, at, up, 40.0f, 1.0f, 0.0f, 1.0f, 1.0f, 0.5f), std::invalid_argument);

  // looking along the up vector
  EXPECT_THROW(camera_t::look_at(from, at, Imath::V3f(0.0f, 0.0f, 1.0f), 40.0f, 1.0f), std::invalid_argument);
  EXPECT_THROW(camera_t::look_at(from, from, up, 40.0f, 1.0f), std::invalid_argument);
}
