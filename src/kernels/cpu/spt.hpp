#pragma once

#include "material.hpp"
#include "sampling.hpp"
#include "scene.hpp"
#include "state.hpp"
#include "utils/color.hpp"

#include <ImathColor.h>

#include <limits>

/**
 * Path tracing integrator
 *
 * Follows a single path from the camera through the scene. Every
 * vertex adds the light emitted there, weighted by the throughput of
 * the path so far, and continues in the direction the material scatters
 * into. Paths end when they leave the scene, get absorbed, or reach the
 * maximum depth. The loop keeps no per bounce state, so its stack usage
 * does not depend on the depth
 */
namespace spt {
  // hits closer than this to the origin of a ray are ignored, which
  // keeps scattered rays from hitting the surface they start on
  static const float T_MIN = 0.001f;

  struct integrator_t {
    const scene_t* scene;
    // optional, orders bvh traversal only
    predictor_t*   predictor;
    int32_t        max_depth;

    inline integrator_t(const scene_t* scene, int32_t max_depth, predictor_t* predictor = nullptr)
      : scene(scene)
      , predictor(predictor)
      , max_depth(max_depth)
    {}

    /* radiance arriving at the origin of 'ray' */
    inline Imath::Color3f li(ray_t ray, sampler_t& sampler) const {
      Imath::Color3f l(0.0f);
      Imath::Color3f beta(1.0f);

      for (int32_t bounce=0;; ++bounce) {
        const auto hit = scene->intersect(
          ray
        , T_MIN
        , std::numeric_limits<float>::max()
        , predictor);

        if (!hit) {
          l += beta * scene->background.value(ray);
          break;
        }

        const auto* material = hit->material;
        if (!material) {
          break;
        }

        l += beta * material->emitted(hit->st, hit->p);

        if (bounce >= max_depth) {
          break;
        }

        const auto scattered = material->scatter(ray, *hit, sampler);
        if (!scattered) {
          break;
        }

        beta *= scattered->attenuation;
        if (color::is_black(beta)) {
          break;
        }

        ray = scattered->ray;
      }

      return l;
    }
  };
}
