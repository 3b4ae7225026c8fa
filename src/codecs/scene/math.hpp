#pragma once

#include "geometry/instance.hpp"

#include <ImathColor.h>
#include <ImathMatrix.h>
#include <ImathVec.h>

#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>

namespace codec {
  namespace scene {
    /* reads a flow sequence of exactly 'n' floats */
    inline bool floats(const YAML::Node& node, size_t n, float* out) {
      if (!node.IsSequence() || node.size() != n) {
        return false;
      }
      for (size_t i=0; i<n; ++i) {
        out[i] = node[i].as<float>();
      }
      return true;
    }
  }
}

/**
 * ! YAML conversions for the Imath types used in scene files
 */
namespace YAML {
  template<>
  struct convert<Imath::V2f> {
    static bool decode(const Node& node, Imath::V2f& v) {
      return codec::scene::floats(node, 2, &v.x);
    }
  };

  template<>
  struct convert<Imath::V3f> {
    static bool decode(const Node& node, Imath::V3f& v) {
      return codec::scene::floats(node, 3, &v.x);
    }
  };

  /* ! accepts [r, g, b] and {type: rgb, value: [r, g, b]} */
  template<>
  struct convert<Imath::Color3f> {
    static bool decode(const Node& node, Imath::Color3f& c) {
      if (!node.IsMap()) {
        return codec::scene::floats(node, 3, &c.x);
      }
      if (node["type"].as<std::string>("rgb") != "rgb") {
        return false;
      }
      return codec::scene::floats(node["value"], 3, &c.x);
    }
  };

  /* ! affine transform importer. a list of steps, each a translate,
   * rotate or scale, applied in the order they are listed */
  template<>
  struct convert<Imath::M44f> {
    static bool decode(const Node& node, Imath::M44f& m) {
      if (!node.IsSequence()) {
        return false;
      }

      m.makeIdentity();

      for (auto i=node.begin(); i!=node.end(); ++i) {
        const auto& step = *i;

        if (const auto t = step["translate"]) {
          m = m * transform::translate(t.as<Imath::V3f>());
        }
        else if (const auto r = step["rotate"]) {
          m = m * transform::rotate(
            r["axis"].as<Imath::V3f>(Imath::V3f(0.0f, 1.0f, 0.0f))
          , r["angle"].as<float>());
        }
        else if (const auto s = step["scale"]) {
          m = m * transform::scale(s.as<Imath::V3f>());
        }
        else {
          return false;
        }
      }

      return true;
    }
  };
}
