#pragma once

#include "math.hpp"
#include "material.hpp"
#include "../../material.hpp"
#include "../../scene.hpp"
#include "accel/bvh.hpp"
#include "geometry/box.hpp"
#include "geometry/instance.hpp"
#include "geometry/medium.hpp"
#include "geometry/rect.hpp"
#include "geometry/sphere.hpp"
#include "geometry/triangle.hpp"

#include <yaml-cpp/yaml.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace codec {
  namespace scene {
    /* media boundaries only shape the medium, they need no material */
    inline const material_t* material(const YAML::Node& node, ::scene_t& scene, bool required = true) {
      if (!node["material"]) {
        if (required) {
          throw std::runtime_error("primitive has no material");
        }
        return nullptr;
      }

      const auto name = node["material"].as<std::string>();
      const auto out  = scene.material(name);
      if (!out) {
        throw std::runtime_error("unknown material: " + name);
      }
      return out;
    }

    inline rect_t::plane_t plane(const std::string& name) {
      if (name == "xy") { return rect_t::XY; }
      if (name == "xz") { return rect_t::XZ; }
      if (name == "yz") { return rect_t::YZ; }
      throw std::runtime_error("unknown rectangle plane: " + name);
    }

    /**
     * ! Primitive importer. Anything with a 'transform' becomes an
     * instance of the primitive, 'group' builds a nested bvh over its
     * children. 'index' names the primitive in generated names, the
     * boundaries of media may leave out their material
     */
    inline primitive_t::scoped_t import_primitive(
      const YAML::Node& node
    , const std::string& index
    , ::scene_t& scene
    , bool boundary = false)
    {
      const auto type = node["type"].as<std::string>();

      primitive_t::scoped_t out;

      if (type == "sphere") {
        out.reset(new sphere_t(
          node["center"].as<Imath::V3f>()
        , node["radius"].as<float>()
        , material(node, scene, !boundary)));
      }
      else if (type == "moving-sphere") {
        out.reset(new moving_sphere_t(
          node["center0"].as<Imath::V3f>()
        , node["center1"].as<Imath::V3f>()
        , node["time0"].as<float>(0.0f)
        , node["time1"].as<float>(1.0f)
        , node["radius"].as<float>()
        , material(node, scene, !boundary)));
      }
      else if (type == "rect") {
        const auto a = node["a"].as<Imath::V2f>();
        const auto b = node["b"].as<Imath::V2f>();
        out.reset(new rect_t(
          plane(node["plane"].as<std::string>())
        , a.x, a.y
        , b.x, b.y
        , node["k"].as<float>()
        , material(node, scene, !boundary)
        , node["flip"].as<bool>(false)));
      }
      else if (type == "box") {
        out.reset(new box_t(
          node["min"].as<Imath::V3f>()
        , node["max"].as<Imath::V3f>()
        , material(node, scene, !boundary)));
      }
      else if (type == "triangle") {
        const auto v = node["vertices"];
        if (!v.IsSequence() || v.size() != 3) {
          throw std::runtime_error("triangle requires three vertices");
        }
        out.reset(new triangle_t(
          v[0].as<Imath::V3f>()
        , v[1].as<Imath::V3f>()
        , v[2].as<Imath::V3f>()
        , material(node, scene, !boundary)));
      }
      else if (type == "medium") {
        const material_t* phase = nullptr;
        if (node["material"]) {
          phase = material(node, scene);
        }
        else {
          const auto name = anonymous("medium" + index, "phase");
          phase = scene.add(name, material_t::make_isotropic(
            texture(node["albedo"], anonymous(name, "albedo"), scene)));
        }

        out.reset(new constant_medium_t(
          import_primitive(node["boundary"], index + ".boundary", scene, true)
        , node["density"].as<float>()
        , phase));
      }
      else if (type == "group") {
        const auto children = node["primitives"];
        if (!children.IsSequence()) {
          throw std::runtime_error("group requires a list of primitives");
        }

        primitives_t primitives;
        for (auto i=0u; i<children.size(); ++i) {
          primitives.emplace_back(import_primitive(children[i], index + "." + std::to_string(i), scene));
        }

        out.reset(new accel::bvh_t(
          std::move(primitives)
        , scene.camera.shutter_open
        , scene.camera.shutter_close));
      }
      else {
        throw std::runtime_error("unknown primitive type: " + type);
      }

      if (const auto transform = node["transform"]) {
        out.reset(new instance_t(std::move(out), transform.as<Imath::M44f>()));
      }

      return out;
    }
  }
}
