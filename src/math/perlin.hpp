#pragma once

#include "trigonometry.hpp"
#include "../sampling.hpp"

#include <ImathVec.h>

#include <cmath>
#include <cstdint>
#include <utility>

/* gradient noise over a seeded permutation table */
struct perlin_t {
  static const int SIZE = 256;

  int perm[SIZE * 2];
  Imath::V3f gradients[SIZE];

  inline perlin_t(uint64_t seed = 237) {
    xoroshiro128plus_t gen(seed);

    for (auto i=0; i<SIZE; ++i) {
      perm[i] = i;
    }

    for (auto i=SIZE-1; i>0; --i) {
      const auto j = (int) (gen() % (uint64_t) (i + 1));
      std::swap(perm[i], perm[j]);
    }

    for (auto i=0; i<SIZE; ++i) {
      perm[SIZE + i] = perm[i];
    }

    for (auto i=0; i<SIZE; ++i) {
      const float theta = sampling::to_float(gen()) * trig::TWO_PI;
      const float phi   = std::acos(2.0f * sampling::to_float(gen()) - 1.0f);
      gradients[i] = Imath::V3f(
        std::sin(phi) * std::cos(theta)
      , std::sin(phi) * std::sin(theta)
      , std::cos(phi));
    }
  }

  inline static float fade(float t) {
    return t * t * t * (t * (t * 6.0f - 15.0f) + 10.0f);
  }

  inline static float lerp(float t, float a, float b) {
    return a + t * (b - a);
  }

  inline float grad(int hash, float x, float y, float z) const {
    const auto& g = gradients[hash & (SIZE - 1)];
    return g.x * x + g.y * y + g.z * z;
  }

  /* noise value in roughly [-1, 1] */
  inline float noise(const Imath::V3f& p) const {
    const auto fx = std::floor(p.x);
    const auto fy = std::floor(p.y);
    const auto fz = std::floor(p.z);

    const int X = ((int) fx) & (SIZE - 1);
    const int Y = ((int) fy) & (SIZE - 1);
    const int Z = ((int) fz) & (SIZE - 1);

    const auto x = p.x - fx;
    const auto y = p.y - fy;
    const auto z = p.z - fz;

    const auto u = fade(x);
    const auto v = fade(y);
    const auto w = fade(z);

    const auto A  = perm[X] + Y;
    const auto AA = perm[A] + Z;
    const auto AB = perm[A + 1] + Z;
    const auto B  = perm[X + 1] + Y;
    const auto BA = perm[B] + Z;
    const auto BB = perm[B + 1] + Z;

    return lerp(w,
      lerp(v,
        lerp(u, grad(perm[AA], x, y, z), grad(perm[BA], x - 1, y, z)),
        lerp(u, grad(perm[AB], x, y - 1, z), grad(perm[BB], x - 1, y - 1, z))),
      lerp(v,
        lerp(u, grad(perm[AA + 1], x, y, z - 1), grad(perm[BA + 1], x - 1, y, z - 1)),
        lerp(u, grad(perm[AB + 1], x, y - 1, z - 1), grad(perm[BB + 1], x - 1, y - 1, z - 1))));
  }

  /* sum of absolute octaves, each at twice the frequency and half the weight */
  inline float turbulence(const Imath::V3f& p, int octaves = 6) const {
    float accum = 0.0f;
    float weight = 1.0f;
    auto q = p;

    for (auto i=0; i<octaves; ++i) {
      accum += weight * std::fabs(noise(q));
      weight *= 0.5f;
      q *= 2.0f;
    }

    return accum;
  }
};
