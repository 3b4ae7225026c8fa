#pragma once

#include "math.hpp"
#include "../../material.hpp"
#include "../../scene.hpp"
#include "texture.hpp"
#include "codecs/image.hpp"
#include "utils/filesystem.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>

namespace codec {
  namespace scene {
    /* names for textures and materials declared inline */
    inline std::string anonymous(const std::string& owner, const std::string& slot) {
      return owner + "." + slot;
    }

    /**
     * ! Resolves a texture reference. A string names a texture declared
     * in the textures section, a color creates a solid texture
     */
    inline const texture_t* texture(
      const YAML::Node& node
    , const std::string& name
    , ::scene_t& scene)
    {
      if (!node) {
        throw std::runtime_error("missing texture: " + name);
      }

      if (node.IsScalar()) {
        const auto ref = node.as<std::string>();
        const auto out = scene.texture(ref);
        if (!out) {
          throw std::runtime_error("unknown texture: " + ref);
        }
        return out;
      }

      if (const auto existing = scene.texture(name)) {
        return existing;
      }
      return scene.add(name, texture_t::make_solid(node.as<Imath::Color3f>()));
    }

    /* ! texture importer, image paths are relative to 'base' */
    inline texture_t* import_texture(
      const std::string& name
    , const YAML::Node& node
    , const std::string& base
    , ::scene_t& scene)
    {
      const auto type = node["type"].as<std::string>();

      if (type == "solid") {
        return texture_t::make_solid(node["color"].as<Imath::Color3f>());
      }
      else if (type == "checker") {
        return texture_t::make_checker(
          node["scale"].as<float>(1.0f)
        , texture(node["even"], anonymous(name, "even"), scene)
        , texture(node["odd"], anonymous(name, "odd"), scene));
      }
      else if (type == "image") {
        const auto path = node["path"].as<std::string>();
        return codec::image::load(fs::resolve(base, path));
      }
      else if (type == "noise") {
        return texture_t::make_noise(
          node["scale"].as<float>(1.0f)
        , node["seed"].as<uint64_t>(0));
      }

      throw std::runtime_error("unknown texture type: " + type);
    }

    /* ! material importer */
    inline material_t* import_material(
      const std::string& name
    , const YAML::Node& node
    , ::scene_t& scene)
    {
      const auto type = node["type"].as<std::string>();

      if (type == "lambert") {
        return material_t::make_lambert(
          texture(node["albedo"], anonymous(name, "albedo"), scene));
      }
      else if (type == "metal") {
        return material_t::make_metal(
          node["albedo"].as<Imath::Color3f>()
        , node["fuzz"].as<float>(0.0f));
      }
      else if (type == "dielectric") {
        return material_t::make_dielectric(node["ior"].as<float>(1.5f));
      }
      else if (type == "isotropic") {
        return material_t::make_isotropic(
          texture(node["albedo"], anonymous(name, "albedo"), scene));
      }
      else if (type == "diffuse-light") {
        return material_t::make_diffuse_light(
          texture(node["emission"], anonymous(name, "emission"), scene));
      }

      throw std::runtime_error("unknown material type: " + type);
    }
  }
}
