#include <gtest/gtest.h>

#include "sampling.hpp"
#include "math/sampling.hpp"

#include <cstdint>
#include <set>

TEST(sampling, floats_are_in_unit_interval) {
  EXPECT_EQ(sampling::to_float(0), 0.0f);
  EXPECT_LT(sampling::to_float(~((uint64_t) 0)), 1.0f);

  sampler_t sampler(3);
  for (auto i=0; i<10000; ++i) {
    const auto v = sampler.sample();
    EXPECT_GE(v, 0.0f);
    EXPECT_LT(v, 1.0f);
  }
}

TEST(sampling, mean_is_one_half) {
  sampler_t sampler(9);

  auto sum = 0.0;
  const auto n = 100000;
  for (auto i=0; i<n; ++i) {
    sum += sampler.sample();
  }
  EXPECT_NEAR(sum / n, 0.5, 0.01);
}

TEST(sampling, pixels_restart_their_stream) {
  sampler_t a(42), b(42);

  // b sees the pixel after having drawn numbers for another one
  b.start_pixel(3, 0, 10);
  b.sample();
  b.sample();

  a.start_pixel(7, 5, 10);
  b.start_pixel(7, 5, 10);

  for (auto i=0; i<16; ++i) {
    EXPECT_EQ(a.sample(), b.sample());
  }
  EXPECT_EQ(a.next_seed(), b.next_seed());
}

TEST(sampling, streams_differ_between_pixels_and_seeds) {
  sampler_t a(42), b(42), c(43);

  a.start_pixel(0, 0, 10);
  b.start_pixel(1, 0, 10);
  c.start_pixel(0, 0, 10);

  const auto x = a.next_seed();
  EXPECT_NE(x, b.next_seed());
  EXPECT_NE(x, c.next_seed());
}

TEST(sampling, splitmix_scrambles) {
  std::set<uint64_t> seen;
  for (uint64_t i=0; i<1000; ++i) {
    seen.insert(sampling::splitmix64(i));
  }
  EXPECT_EQ(seen.size(), 1000u);
}

TEST(sampling, stratified_samples_stay_in_their_cell) {
  for (auto i=0u; i<16; ++i) {
    const auto p = sample::stratified_2d(i, 16, Imath::V2f(0.5f, 0.5f));
    EXPECT_FLOAT_EQ(p.x, ((i % 4) + 0.5f) * 0.25f);
    EXPECT_FLOAT_EQ(p.y, ((i / 4) + 0.5f) * 0.25f);
  }

  // one sample jitters over the whole pixel
  const auto single = sample::stratified_2d(0, 1, Imath::V2f(0.3f, 0.7f));
  EXPECT_FLOAT_EQ(single.x, 0.3f);
  EXPECT_FLOAT_EQ(single.y, 0.7f);

  // samples past the largest square grid as well
  const auto extra = sample::stratified_2d(9, 10, Imath::V2f(0.3f, 0.7f));
  EXPECT_FLOAT_EQ(extra.x, 0.3f);
  EXPECT_FLOAT_EQ(extra.y, 0.7f);
}

TEST(sampling, concentric_disc_stays_inside) {
  sampler_t sampler(1);
  for (auto i=0; i<10000; ++i) {
    EXPECT_LE(sample::disc::concentric(sampler.sample2()).length(), 1.0f + 1e-5f);
  }
  EXPECT_EQ(sample::disc::concentric(Imath::V2f(0.5f, 0.5f)), Imath::V2f(0.0f, 0.0f));
}

TEST(sampling, cosine_weighted_directions_are_unit_length) {
  sampler_t sampler(2);
  for (auto i=0; i<1000; ++i) {
    Imath::V3f w;
    float pdf;
    sample::hemisphere::cosine_weighted(sampler.sample2(), w, pdf);

    EXPECT_NEAR(w.length(), 1.0f, 1e-4f);
    EXPECT_GE(w.y, 0.0f);
    EXPECT_GE(pdf, 0.0f);
  }
}
