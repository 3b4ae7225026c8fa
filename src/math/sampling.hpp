#pragma once

#include "trigonometry.hpp"

#include <ImathVec.h>

#include <algorithm>
#include <cmath>

namespace sample {
  namespace hemisphere {
    /* cosine weighted direction in tangent space, with y pointing
     * along the normal */
    inline void cosine_weighted(
      const Imath::V2f& sample
    , Imath::V3f& out
    , float& pdf)
    {
      const float r = std::sqrt(sample.x);
      const float theta = trig::TWO_PI * sample.y;

      const float x = r * std::cos(theta);
      const float y = r * std::sin(theta);

      out = Imath::V3f(x, std::sqrt(std::max(0.0f, 1.0f - sample.x)), y);
      pdf = out.y * trig::INV_PI;
    }
  }

  namespace sphere {
    /* uniformly distributed direction on the unit sphere */
    inline Imath::V3f uniform(const Imath::V2f& sample) {
      const float z   = 1.0f - 2.0f * sample.x;
      const float r   = std::sqrt(std::max(0.0f, 1.0f - z * z));
      const float phi = trig::TWO_PI * sample.y;

      return Imath::V3f(r * std::cos(phi), r * std::sin(phi), z);
    }

    /* point inside the unit ball, from three uniform numbers */
    inline Imath::V3f inside(const Imath::V2f& sample, float u) {
      return uniform(sample) * std::cbrt(u);
    }
  }

  namespace disc {
    /* maps the unit square onto the unit disc, preserving strata */
    inline Imath::V2f concentric(const Imath::V2f& sample) {
      const auto offset = 2.0f * sample - Imath::V2f(1, 1);

      if (offset.x == 0.0f && offset.y == 0.0f) {
        return Imath::V2f(0.0f, 0.0f);
      }

      float r, theta;
      if (std::abs(offset.x) > std::abs(offset.y)) {
        r = offset.x;
        theta = 0.25f * trig::PI * (offset.y / offset.x);
      }
      else {
        r = offset.y;
        theta = 0.5f * trig::PI - 0.25f * trig::PI * (offset.x / offset.y);
      }

      return r * Imath::V2f(std::cos(theta), std::sin(theta));
    }
  }

  /**
   * Position of sample 'i' of 'num' inside a pixel. The first n*n samples,
   * with n the integer square root of 'num', are stratified over an n by n
   * grid, and the remaining ones are jittered over the whole pixel
   */
  inline Imath::V2f stratified_2d(uint32_t i, uint32_t num, const Imath::V2f& jitter) {
    const auto n = (uint32_t) std::sqrt((float) num);
    if (n > 1 && i < n * n) {
      const float step = 1.0f / (float) n;
      return {
        ((i % n) + jitter.x) * step,
        ((i / n) + jitter.y) * step
      };
    }
    return jitter;
  }
}
