#pragma once

#include <functional>
#include <string>

#include <yaml-cpp/yaml.h>

struct render_config_t;
struct scene_t;

namespace codec {
  namespace scene {
    /* applied to the render settings after the file has been read */
    typedef std::function<void (render_config_t&)> overrides_t;

    /**
     * ! Imports a scene description in YAML format from 'path'
     * and writes the results to 'scene'. Render settings found in
     * the file override those in 'config', 'overrides' gets the last
     * word before the camera is set up. Throws std::runtime_error
     * if the description can't be imported.
     */
    void import(
      const std::string& path
    , scene_t& scene
    , render_config_t& config
    , const overrides_t& overrides = nullptr);

    /* import from a parsed document, relative paths start at 'base' */
    void import(
      const YAML::Node& root
    , const std::string& base
    , scene_t& scene
    , render_config_t& config
    , const overrides_t& overrides = nullptr);
  }
}
