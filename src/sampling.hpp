#pragma once

#include <ImathVec.h>

#include <cstdint>

/* random number engine, that complies with the c++ standard */
struct xoroshiro128plus_t {
  typedef uint64_t result_type;

  uint64_t s0, s1;

  xoroshiro128plus_t(uint64_t seed = 0);

  static constexpr uint64_t min() {
    return 0;
  }

  static constexpr uint64_t max() {
    return ~((uint64_t) 0);
  }

  void seed(uint64_t seed);

  uint64_t operator()();
};

/**
 * Source of uniform random numbers for a worker. The stream is restarted
 * for every pixel from the frame seed and the pixel index, so the numbers
 * a pixel sees do not depend on which thread renders it, or in which
 * order tiles are handed out
 */
struct sampler_t {
  xoroshiro128plus_t gen;
  uint64_t frame_seed;

  sampler_t(uint64_t seed = 0);

  /* restart the random stream for the given pixel */
  void start_pixel(uint32_t x, uint32_t y, uint32_t width);

  /* uniform number in [0, 1) */
  float sample();

  Imath::V2f sample2();

  /* raw 64 bits, used to seed rays */
  uint64_t next_seed();
};

namespace sampling {
  /* scrambles a 64 bit value, used to derive independent seeds */
  uint64_t splitmix64(uint64_t x);

  /* maps 64 random bits onto [0, 1) */
  float to_float(uint64_t x);
}
