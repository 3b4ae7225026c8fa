#pragma once

#include <algorithm>
#include <cmath>

namespace fresnel {
  inline float schlick_weight(float cos_theta) {
    const auto m = std::clamp(1.0f - cos_theta, 0.0f, 1.0f);
    return (m * m) * (m * m) * m;
  }

  /* Schlick's approximation of the reflectance of a dielectric
   * interface, 'eta' is the ratio of refractive indices */
  inline float schlick(float cosi, float eta) {
    auto r0 = (1.0f - eta) / (1.0f + eta);
    r0 = r0 * r0;
    return r0 + (1.0f - r0) * schlick_weight(cosi);
  }
}
