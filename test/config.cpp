#include <gtest/gtest.h>

#include "options.hpp"

#include <stdexcept>

TEST(config, defaults_are_valid) {
  render_config_t config;

  EXPECT_NO_THROW(config.validate());
  EXPECT_EQ(config.image_width, 640);
  EXPECT_EQ(config.image_height, 480);
  EXPECT_EQ(config.accel, render_config_t::BVH);
  EXPECT_FALSE(config.predictor);
  EXPECT_FLOAT_EQ(config.aspect(), 640.0f / 480.0f);
}

TEST(config, zero_max_depth_is_valid) {
  render_config_t config;
  config.max_depth = 0;
  EXPECT_NO_THROW(config.validate());
}

TEST(config, rejects_empty_image) {
  render_config_t a, b;
  a.image_width = 0;
  b.image_height = -4;

  EXPECT_THROW(a.validate(), std::invalid_argument);
  EXPECT_THROW(b.validate(), std::invalid_argument);
}

TEST(config, rejects_zero_samples) {
  render_config_t config;
  config.samples_per_pixel = 0;
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(config, rejects_negative_depth) {
  render_config_t config;
  config.max_depth = -1;
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(config, rejects_zero_threads) {
  render_config_t config;
  config.thread_count = 0;
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(config, rejects_zero_tile_size) {
  render_config_t config;
  config.tile_size = 0;
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(config, rejects_non_positive_gamma) {
  render_config_t a, b;
  a.gamma = 0.0f;
  b.gamma = -2.2f;

  EXPECT_THROW(a.validate(), std::invalid_argument);
  EXPECT_THROW(b.validate(), std::invalid_argument);
}
