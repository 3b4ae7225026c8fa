#include "scene.hpp"
#include "material.hpp"
#include "texture.hpp"
#include "accel/bvh.hpp"
#include "accel/list.hpp"

#include <memory>
#include <stdexcept>
#include <unordered_map>
#include <vector>

struct scene_t::details_t {
  std::vector<std::unique_ptr<texture_t>>  textures;
  std::vector<std::unique_ptr<material_t>> materials;

  std::unordered_map<std::string, texture_t*>  textures_by_name;
  std::unordered_map<std::string, material_t*> materials_by_name;

  // primitives waiting to be handed to the accelerator
  primitives_t primitives;

  // exactly one of these is set after preprocessing
  std::unique_ptr<accel::bvh_t>  bvh;
  std::unique_ptr<accel::list_t> list;
};

scene_t::scene_t()
  : details(new details_t()) {
}

scene_t::~scene_t() {
  reset();
  delete details;
}

void scene_t::reset() {
  // primitives reference materials, which reference textures
  details->bvh.reset();
  details->list.reset();
  details->primitives.clear();

  details->materials_by_name.clear();
  details->materials.clear();

  details->textures_by_name.clear();
  details->textures.clear();
}

void scene_t::preprocess(render_config_t::accel_t accel) {
  if (details->bvh || details->list) {
    throw std::runtime_error("scene has already been preprocessed");
  }

  if (accel == render_config_t::LIST) {
    details->list.reset(new accel::list_t(std::move(details->primitives)));
  }
  else {
    details->bvh.reset(new accel::bvh_t(
      std::move(details->primitives)
    , camera.shutter_open
    , camera.shutter_close));
  }
  details->primitives.clear();
}

texture_t* scene_t::add(const std::string& name, texture_t* texture) {
  std::unique_ptr<texture_t> owned(texture);

  if (details->textures_by_name.count(name)) {
    throw std::runtime_error("duplicate texture: " + name);
  }

  texture->id = details->textures.size();
  details->textures_by_name[name] = texture;
  details->textures.emplace_back(std::move(owned));
  return texture;
}

material_t* scene_t::add(const std::string& name, material_t* material) {
  std::unique_ptr<material_t> owned(material);

  if (details->materials_by_name.count(name)) {
    throw std::runtime_error("duplicate material: " + name);
  }

  material->id = details->materials.size();
  details->materials_by_name[name] = material;
  details->materials.emplace_back(std::move(owned));
  return material;
}

void scene_t::add(primitive_t::scoped_t primitive) {
  if (details->bvh || details->list) {
    throw std::runtime_error("can't add primitives to a preprocessed scene");
  }
  details->primitives.emplace_back(std::move(primitive));
}

uint32_t scene_t::num_textures() const {
  return details->textures.size();
}

uint32_t scene_t::num_materials() const {
  return details->materials.size();
}

uint32_t scene_t::num_primitives() const {
  if (details->bvh) {
    return details->bvh->num_primitives();
  }
  if (details->list) {
    return details->list->size();
  }
  return details->primitives.size();
}

texture_t* scene_t::texture(const std::string& name) const {
  const auto guard = details->textures_by_name.find(name);
  if (guard != details->textures_by_name.end()) {
    return guard->second;
  }
  return nullptr;
}

material_t* scene_t::material(const std::string& name) const {
  const auto guard = details->materials_by_name.find(name);
  if (guard != details->materials_by_name.end()) {
    return guard->second;
  }
  return nullptr;
}

std::optional<interaction_t> scene_t::intersect(
  const ray_t& ray
, float t_min
, float t_max
, predictor_t* predictor) const
{
  if (details->bvh) {
    return details->bvh->intersect(ray, t_min, t_max, predictor);
  }
  if (details->list) {
    return details->list->intersect(ray, t_min, t_max);
  }
  return std::nullopt;
}

Imath::Box3f scene_t::bounds() const {
  if (details->bvh) {
    return details->bvh->bounds(camera.shutter_open, camera.shutter_close);
  }
  if (details->list) {
    return details->list->bounds(camera.shutter_open, camera.shutter_close);
  }
  return Imath::Box3f();
}
