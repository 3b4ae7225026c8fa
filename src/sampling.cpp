#include "sampling.hpp"

#include <cstring>

namespace sampling {
  uint64_t splitmix64(uint64_t x) {
    x += 0x9e3779b97f4a7c15ull;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
    return x ^ (x >> 31);
  }

  float to_float(uint64_t x) {
    // the top 23 bits go into the mantissa of a float in [1, 2)
    const uint32_t bits = ((uint32_t) (x >> 41)) | 0x3f800000u;
    float out;
    std::memcpy(&out, &bits, sizeof(out));
    return out - 1.0f;
  }
}

namespace {
  inline uint64_t rotl(uint64_t a, int w) {
    return a << w | a >> (64-w);
  }
}

xoroshiro128plus_t::xoroshiro128plus_t(uint64_t s) {
  seed(s);
}

void xoroshiro128plus_t::seed(uint64_t s) {
  s0 = sampling::splitmix64(s);
  s1 = sampling::splitmix64(s0);

  // the all zero state is a fixed point
  if (s0 == 0 && s1 == 0) {
    s1 = 1;
  }
}

uint64_t xoroshiro128plus_t::operator()() {
  const uint64_t result = s0 + s1;

  s1 ^= s0;
  s0 = rotl(s0, 55) ^ s1 ^ (s1 << 14);
  s1 = rotl(s1, 36);

  return result;
}

sampler_t::sampler_t(uint64_t seed)
  : gen(seed)
  , frame_seed(seed)
{}

void sampler_t::start_pixel(uint32_t x, uint32_t y, uint32_t width) {
  const auto index = (uint64_t) y * width + x;
  gen.seed(sampling::splitmix64(frame_seed) ^ sampling::splitmix64(index + 1));
}

float sampler_t::sample() {
  return sampling::to_float(gen());
}

Imath::V2f sampler_t::sample2() {
  const auto x = sample();
  const auto y = sample();
  return { x, y };
}

uint64_t sampler_t::next_seed() {
  return gen();
}
