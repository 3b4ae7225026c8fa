#pragma once

namespace trig {
  static constexpr float PI         = 3.14159265358979323846f;
  static constexpr float TWO_PI     = 2.0f * PI;
  static constexpr float INV_PI     = 1.0f / PI;
  static constexpr float INV_TWO_PI = 1.0f / TWO_PI;

  inline constexpr float radians(float degrees) {
    return degrees * (PI / 180.0f);
  }
}
