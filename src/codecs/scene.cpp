#include "scene.hpp"
#include "../scene.hpp"
#include "scene/entities.hpp"
#include "scene/material.hpp"
#include "scene/primitive.hpp"
#include "utils/filesystem.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace codec {
  namespace scene {
    void import_textures(const YAML::Node& textures, const std::string& base, ::scene_t& scene) {
      for (auto i=textures.begin(); i!=textures.end(); ++i) {
        const auto name = i->first.as<std::string>();
        scene.add(name, import_texture(name, i->second, base, scene));
      }
    }

    void import_materials(const YAML::Node& materials, ::scene_t& scene) {
      for (auto i=materials.begin(); i!=materials.end(); ++i) {
        const auto name = i->first.as<std::string>();
        scene.add(name, import_material(name, i->second, scene));
      }
    }

    void import_primitives(const YAML::Node& primitives, ::scene_t& scene) {
      if (!primitives.IsSequence()) {
        throw std::runtime_error("primitives must be a list");
      }

      for (auto i=0u; i<primitives.size(); ++i) {
        scene.add(import_primitive(primitives[i], std::to_string(i), scene));
      }
    }

    void import(
      const YAML::Node& root
    , const std::string& base
    , ::scene_t& scene
    , render_config_t& config
    , const overrides_t& overrides)
    {
      if (const auto render = root["render"]) {
        import_render_config(render, config);
      }

      if (overrides) {
        overrides(config);
      }

      // the camera decides the time interval bvhs are built for, so
      // it goes before any primitives
      if (const auto camera = root["camera"]) {
        scene.camera = import_camera(camera, config.aspect());
      }
      else {
        throw std::runtime_error("scene has no camera");
      }

      if (const auto background = root["background"]) {
        scene.background = background.as<background_t>();
      }

      if (const auto textures = root["textures"]) {
        import_textures(textures, base, scene);
      }

      if (const auto materials = root["materials"]) {
        import_materials(materials, scene);
      }

      if (const auto primitives = root["primitives"]) {
        import_primitives(primitives, scene);
      }
    }

    void import(
      const std::string& path
    , ::scene_t& scene
    , render_config_t& config
    , const overrides_t& overrides)
    {
      YAML::Node root;
      try {
        root = YAML::LoadFile(path);
      }
      catch (const YAML::Exception& e) {
        throw std::runtime_error("failed to load " + path + ": " + e.what());
      }

      import(root, fs::basepath(path), scene, config, overrides);
    }
  }
}
