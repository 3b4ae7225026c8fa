#pragma once

#include "math.hpp"
#include "options.hpp"
#include "../../scene.hpp"
#include "entities/camera.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>

/**
 * ! YAML importer code for all common renderer entities
 */
namespace YAML {
  /* ! acceleration structure importer */
  template<>
  struct convert<render_config_t::accel_t> {
    static bool decode(const Node& node, render_config_t::accel_t& accel) {
      const auto name = node.as<std::string>();
      if (name == "bvh") {
        accel = render_config_t::BVH;
        return true;
      }
      if (name == "list") {
        accel = render_config_t::LIST;
        return true;
      }
      return false;
    }
  };

  /* ! background importer */
  template<>
  struct convert<background_t> {
    static bool decode(const Node& node, background_t& background) {
      // a plain color
      if (node.IsSequence()) {
        background = background_t::make_solid(node.as<Imath::Color3f>());
        return true;
      }

      if (!node.IsMap()) {
        return false;
      }

      const auto type = node["type"].as<std::string>("solid");
      if (type == "solid") {
        background = background_t::make_solid(node["color"].as<Imath::Color3f>());
        return true;
      }
      if (type == "gradient") {
        background = background_t::make_gradient(
          node["bottom"].as<Imath::Color3f>()
        , node["top"].as<Imath::Color3f>());
        return true;
      }
      return false;
    }
  };
}

namespace codec {
  namespace scene {
    /* ! render settings importer, only overrides what's listed */
    inline void import_render_config(const YAML::Node& node, render_config_t& config) {
      if (!node.IsMap()) {
        throw std::runtime_error("render settings must be a map");
      }

      config.image_width       = node["width"].as<int32_t>(config.image_width);
      config.image_height      = node["height"].as<int32_t>(config.image_height);
      config.samples_per_pixel = node["samples-per-pixel"].as<int32_t>(config.samples_per_pixel);
      config.max_depth         = node["max-depth"].as<int32_t>(config.max_depth);
      config.thread_count      = node["threads"].as<int32_t>(config.thread_count);
      config.tile_size         = node["tile-size"].as<int32_t>(config.tile_size);
      config.random_seed       = node["seed"].as<uint64_t>(config.random_seed);
      config.gamma             = node["gamma"].as<float>(config.gamma);
      config.predictor         = node["predictor"].as<bool>(config.predictor);
      config.accel             = node["accel"].as<render_config_t::accel_t>(config.accel);
    }

    /* ! camera importer, the aspect ratio follows from the image size */
    inline camera_t import_camera(const YAML::Node& node, float aspect) {
      if (!node.IsMap()) {
        throw std::runtime_error("camera must be a map");
      }

      const auto from = node["position"].as<Imath::V3f>();
      const auto at   = node["at"].as<Imath::V3f>();
      const auto up   = node["up"].as<Imath::V3f>(Imath::V3f(0.0f, 1.0f, 0.0f));

      const auto shutter = node["shutter"].as<Imath::V2f>(Imath::V2f(0.0f, 0.0f));

      return camera_t::look_at(
        from
      , at
      , up
      , node["fov"].as<float>(40.0f)
      , aspect
      , node["aperture"].as<float>(0.0f)
      , node["focus-distance"].as<float>((from - at).length())
      , shutter.x
      , shutter.y);
    }
  }
}
