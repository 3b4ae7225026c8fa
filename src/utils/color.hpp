#pragma once

#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-register"
#include <ImathColor.h>
#pragma clang diagnostic pop

#include <algorithm>
#include <cmath>

namespace color {
  inline bool is_black(const Imath::Color3f& c) {
    return c.x == 0.0f && c.y == 0.0f && c.z == 0.0f;
  }

  inline bool is_finite(const Imath::Color3f& c) {
    return std::isfinite(c.x) && std::isfinite(c.y) && std::isfinite(c.z);
  }

  /* encode a linear value for display, and clamp it to [0, 1] */
  inline float gamma(float v, float g) {
    if (!(v > 0.0f)) {
      return 0.0f;
    }
    if (g == 1.0f) {
      return std::min(v, 1.0f);
    }
    const auto out = g == 2.0f ? std::sqrt(v) : std::pow(v, 1.0f / g);
    return std::min(out, 1.0f);
  }

  inline Imath::Color3f gamma(const Imath::Color3f& c, float g) {
    return Imath::Color3f(gamma(c.x, g), gamma(c.y, g), gamma(c.z, g));
  }
}
