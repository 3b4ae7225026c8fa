#pragma once

#include "material.hpp"
#include "options.hpp"
#include "scene.hpp"
#include "state.hpp"
#include "texture.hpp"
#include "film/framebuffer.hpp"
#include "jobs/tiles.hpp"
#include "xpu/cpu.hpp"

#include <memory>

namespace test {
  /* renders 'scene' into a framebuffer with a single cpu device */
  inline film::framebuffer_t render(
    const scene_t& scene
  , const render_config_t& config
  , predictor_t* predictor = nullptr)
  {
    film::framebuffer_t film(config.image_width, config.image_height);

    std::unique_ptr<job::tiles_t> tiles(job::tiles_t::make(
      config.image_width
    , config.image_height
    , config.tile_size));

    frame_state_t state(tiles.get(), &film, predictor);

    cpu_t cpu(config);
    cpu.start(scene, state);
    cpu.join();

    return film;
  }

  inline const material_t* lambert(scene_t& scene, const std::string& name, const Imath::Color3f& albedo) {
    auto texture = scene.add(name + ".albedo", texture_t::make_solid(albedo));
    return scene.add(name, material_t::make_lambert(texture));
  }

  inline const material_t* light(scene_t& scene, const std::string& name, const Imath::Color3f& emission) {
    auto texture = scene.add(name + ".emission", texture_t::make_solid(emission));
    return scene.add(name, material_t::make_diffuse_light(texture));
  }
}
