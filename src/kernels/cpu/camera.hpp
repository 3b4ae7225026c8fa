#pragma once

#include "entities/camera.hpp"
#include "sampling.hpp"
#include "state.hpp"
#include "math/sampling.hpp"

namespace camera {
  inline Imath::V2f sample_aperture(
    const camera_t& camera
  , const Imath::V2f& sample)
  {
    return sample::disc::concentric(sample) * camera.lens_radius;
  }

  struct perspective_kernel_t {
    /* ray through the image at (s, t), with t growing upwards. the lens
     * is only sampled if the camera has an aperture, the shutter only
     * if it stays open for some time */
    inline ray_t operator()(
      const camera_t& camera
    , float s
    , float t
    , sampler_t& sampler) const
    {
      auto p = camera.origin;

      if (!camera.is_pinhole()) {
        const auto lens = sample_aperture(camera, sampler.sample2());
        p += camera.u * lens.x + camera.v * lens.y;
      }

      auto time = camera.shutter_open;
      if (camera.shutter_close > camera.shutter_open) {
        time += sampler.sample() * (camera.shutter_close - camera.shutter_open);
      }

      const auto target = camera.lower_left + s * camera.horizontal + t * camera.vertical;

      return ray_t(p, target - p, time, sampler.next_seed());
    }
  };
}
