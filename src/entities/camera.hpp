#pragma once

#include "math/trigonometry.hpp"

#include <ImathVec.h>

#include <cmath>
#include <stdexcept>

/* The camera data model, used by the rest of the rendering
 * system. Immutable once constructed */
struct camera_t {
  Imath::V3f origin;
  // orthonormal basis, w points away from the viewing direction
  Imath::V3f u, v, w;

  Imath::V3f lower_left;
  Imath::V3f horizontal;
  Imath::V3f vertical;

  float lens_radius;
  float focus_distance;

  float shutter_open;
  float shutter_close;

  inline camera_t()
    : origin(0.0f)
    , u(1.0f, 0.0f, 0.0f), v(0.0f, 1.0f, 0.0f), w(0.0f, 0.0f, 1.0f)
    , lower_left(-1.0f, -1.0f, -1.0f)
    , horizontal(2.0f, 0.0f, 0.0f)
    , vertical(0.0f, 2.0f, 0.0f)
    , lens_radius(0.0f)
    , focus_distance(1.0f)
    , shutter_open(0.0f)
    , shutter_close(0.0f)
  {}

  inline bool is_pinhole() const {
    return lens_radius == 0.0f;
  }

  /**
   * Places a camera at 'from' looking at 'at'. 'vfov' is the vertical
   * field of view in degrees, 'aperture' the diameter of the lens. Rays
   * through the same point on the image converge at 'focus_distance'
   */
  static inline camera_t look_at(
    const Imath::V3f& from
  , const Imath::V3f& at
  , const Imath::V3f& up
  , float vfov
  , float aspect
  , float aperture = 0.0f
  , float focus_distance = 1.0f
  , float shutter_open = 0.0f
  , float shutter_close = 0.0f)
  {
    if (!(vfov > 0.0f && vfov < 180.0f)) {
      throw std::invalid_argument("camera field of view must be in (0, 180) degrees");
    }
    if (!(aspect > 0.0f)) {
      throw std::invalid_argument("camera aspect ratio must be positive");
    }
    if (!(focus_distance > 0.0f)) {
      throw std::invalid_argument("camera focus distance must be positive");
    }
    if (aperture < 0.0f) {
      throw std::invalid_argument("camera aperture must not be negative");
    }
    if (shutter_close < shutter_open) {
      throw std::invalid_argument("camera shutter closes before it opens");
    }

    const auto w = (from - at).normalized();
    const auto u = up.cross(w).normalized();
    if (w.length2() == 0.0f || u.length2() == 0.0f) {
      throw std::invalid_argument("camera orientation is degenerate");
    }
    const auto v = w.cross(u);

    const auto h = std::tan(trig::radians(vfov) * 0.5f);
    const auto viewport_height = 2.0f * h;
    const auto viewport_width  = aspect * viewport_height;

    camera_t out;
    out.origin         = from;
    out.u              = u;
    out.v              = v;
    out.w              = w;
    out.horizontal     = focus_distance * viewport_width * u;
    out.vertical       = focus_distance * viewport_height * v;
    out.lower_left     = from - out.horizontal * 0.5f - out.vertical * 0.5f - focus_distance * w;
    out.lens_radius    = aperture * 0.5f;
    out.focus_distance = focus_distance;
    out.shutter_open   = shutter_open;
    out.shutter_close  = shutter_close;
    return out;
  }
};
