#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

/* Settings for rendering one frame */
struct render_config_t {
  static const uint32_t DEFAULT_SAMPLES_PER_PIXEL = 16;
  static const uint32_t DEFAULT_PATH_DEPTH = 9;
  static const uint32_t DEFAULT_TILE_SIZE = 16;

  enum accel_t {
    BVH, // bounding volume hierarchy over all primitives
    LIST // test every primitive, for reference renders
  };

  int32_t image_width;
  int32_t image_height;
  // number of camera rays traced per pixel
  int32_t samples_per_pixel;
  // maximum number of scattering events along a path
  int32_t max_depth;
  // number of render threads
  int32_t thread_count;
  // edge length of the square tiles the image is split into
  int32_t tile_size;
  // every random decision of the frame derives from this
  uint64_t random_seed;
  // display gamma applied to the averaged pixel color
  float gamma;
  // order bvh traversal with the traversal predictor
  bool predictor;

  accel_t accel;

  inline render_config_t()
    : image_width(640)
    , image_height(480)
    , samples_per_pixel(DEFAULT_SAMPLES_PER_PIXEL)
    , max_depth(DEFAULT_PATH_DEPTH)
    , thread_count(1)
    , tile_size(DEFAULT_TILE_SIZE)
    , random_seed(0)
    , gamma(2.0f)
    , predictor(false)
    , accel(BVH)
  {}

  /* throws std::invalid_argument for settings nothing can be rendered with */
  inline void validate() const {
    if (image_width <= 0 || image_height <= 0) {
      throw std::invalid_argument("image dimensions must be positive");
    }
    if (samples_per_pixel < 1) {
      throw std::invalid_argument("samples per pixel must be at least 1");
    }
    if (max_depth < 0) {
      throw std::invalid_argument("max depth must not be negative");
    }
    if (thread_count < 1) {
      throw std::invalid_argument("thread count must be at least 1");
    }
    if (tile_size <= 0) {
      throw std::invalid_argument("tile size must be positive");
    }
    if (!(gamma > 0.0f)) {
      throw std::invalid_argument("gamma must be positive");
    }
  }

  inline float aspect() const {
    return (float) image_width / (float) image_height;
  }
};

/* Parsed command line options */
struct parsed_options_t {
  std::string scene;
  std::string output;

  // print progress and statistics while rendering
  bool verbose;

  render_config_t config;

  inline parsed_options_t()
    : output("out.png")
    , verbose(false)
  {}
};
