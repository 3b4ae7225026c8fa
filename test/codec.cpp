#include <gtest/gtest.h>

#include "codecs/scene.hpp"
#include "material.hpp"
#include "options.hpp"
#include "scene.hpp"
#include "texture.hpp"

#include <yaml-cpp/yaml.h>

#include <limits>
#include <stdexcept>
#include <string>

namespace {
  const float INF = std::numeric_limits<float>::max();

  const char* SCENE = R"(
render:
  width: 64
  height: 32
  samples-per-pixel: 8
  max-depth: 3
  threads: 2
  tile-size: 8
  seed: 77
  gamma: 2.2
  predictor: true
  accel: list

camera:
  position: [0, 1, 5]
  at: [0, 1, 0]
  fov: 45
  aperture: 0.1
  shutter: [0, 1]

background:
  type: gradient
  bottom: [1, 1, 1]
  top: [0.5, 0.7, 1.0]

textures:
  white: {type: solid, color: [0.9, 0.9, 0.9]}
  checks: {type: checker, scale: 2, even: white, odd: [0.1, 0.1, 0.1]}
  marble: {type: noise, scale: 4, seed: 3}

materials:
  floor: {type: lambert, albedo: checks}
  red: {type: lambert, albedo: [0.8, 0.1, 0.1]}
  stone: {type: lambert, albedo: marble}
  mirror: {type: metal, albedo: [0.9, 0.9, 0.9], fuzz: 0.1}
  glass: {type: dielectric}
  lamp: {type: diffuse-light, emission: {type: rgb, value: [4, 4, 4]}}

primitives:
  - {type: rect, plane: xz, a: [-5, 5], b: [-5, 5], k: 0, material: floor}
  - {type: sphere, center: [0, 1, 0], radius: 1, material: glass}
  - {type: moving-sphere, center0: [2, 1, 0], center1: [2, 1.5, 0], radius: 0.5, material: stone}
  - type: box
    min: [0, 0, 0]
    max: [1, 1, 1]
    material: red
    transform:
      - rotate: {angle: 15}
      - translate: [-3, 0, 0]
  - {type: triangle, vertices: [[0, 0, -2], [1, 0, -2], [0, 1, -2]], material: mirror}
  - type: medium
    density: 0.5
    albedo: [1, 1, 1]
    boundary: {type: sphere, center: [0, 1, 3], radius: 0.5}
  - type: group
    primitives:
      - {type: sphere, center: [-2, 3, 0], radius: 0.3, material: lamp}
      - {type: sphere, center: [2, 3, 0], radius: 0.3, material: lamp}
)";

  const char* MINIMAL = R"(
camera:
  position: [0, 0, 5]
  at: [0, 0, 0]
)";

  void load(const std::string& text, scene_t& scene, render_config_t& config) {
    codec::scene::import(YAML::Load(text), "", scene, config);
  }

  /* a minimal scene followed by 'extra' */
  void load_with(const std::string& extra) {
    scene_t scene;
    render_config_t config;
    load(std::string(MINIMAL) + extra, scene, config);
  }
}

TEST(codec, imports_render_settings) {
  scene_t scene;
  render_config_t config;
  load(SCENE, scene, config);

  EXPECT_EQ(config.image_width, 64);
  EXPECT_EQ(config.image_height, 32);
  EXPECT_EQ(config.samples_per_pixel, 8);
  EXPECT_EQ(config.max_depth, 3);
  EXPECT_EQ(config.thread_count, 2);
  EXPECT_EQ(config.tile_size, 8);
  EXPECT_EQ(config.random_seed, 77u);
  EXPECT_FLOAT_EQ(config.gamma, 2.2f);
  EXPECT_TRUE(config.predictor);
  EXPECT_EQ(config.accel, render_config_t::LIST);
}

TEST(codec, keeps_settings_the_file_leaves_out) {
  scene_t scene;
  render_config_t config;
  config.samples_per_pixel = 123;
  load(MINIMAL, scene, config);

  EXPECT_EQ(config.samples_per_pixel, 123);
  EXPECT_EQ(config.image_width, 640);
}

TEST(codec, imports_camera_and_background) {
  scene_t scene;
  render_config_t config;
  load(SCENE, scene, config);

  const auto& camera = scene.camera;
  EXPECT_EQ(camera.origin, Imath::V3f(0.0f, 1.0f, 5.0f));
  EXPECT_FLOAT_EQ(camera.lens_radius, 0.05f);
  EXPECT_FLOAT_EQ(camera.focus_distance, 5.0f);
  EXPECT_FLOAT_EQ(camera.shutter_open, 0.0f);
  EXPECT_FLOAT_EQ(camera.shutter_close, 1.0f);
  EXPECT_NEAR(camera.horizontal.length() / camera.vertical.length(), 2.0f, 1e-4f);

  EXPECT_EQ(scene.background.type, background_t::GRADIENT);
  EXPECT_EQ(scene.background.bottom, Imath::Color3f(1.0f));
  EXPECT_EQ(scene.background.top, Imath::Color3f(0.5f, 0.7f, 1.0f));
}

TEST(codec, imports_textures_and_materials) {
  scene_t scene;
  render_config_t config;
  load(SCENE, scene, config);

  // inline colors become textures of their own
  ASSERT_NE(scene.texture("checks"), nullptr);
  ASSERT_NE(scene.texture("checks.odd"), nullptr);
  ASSERT_NE(scene.texture("red.albedo"), nullptr);
  ASSERT_NE(scene.texture("lamp.emission"), nullptr);
  EXPECT_EQ(scene.texture("checks")->type, texture_t::CHECKER);
  EXPECT_EQ(scene.texture("marble")->type, texture_t::NOISE);

  EXPECT_EQ(scene.material("floor")->type, material_t::LAMBERT);
  EXPECT_EQ(scene.material("mirror")->type, material_t::METAL);
  EXPECT_EQ(scene.material("glass")->type, material_t::DIELECTRIC);
  EXPECT_EQ(scene.material("lamp")->type, material_t::DIFFUSE_LIGHT);

  // the medium made its own phase function
  ASSERT_NE(scene.material("medium5.phase"), nullptr);
  EXPECT_EQ(scene.material("medium5.phase")->type, material_t::ISOTROPIC);

  EXPECT_EQ(scene.num_materials(), 7u);
  EXPECT_EQ(scene.num_textures(), 7u);
  EXPECT_EQ(scene.num_primitives(), 7u);
}

TEST(codec, imported_primitives_can_be_hit) {
  scene_t scene;
  render_config_t config;
  load(SCENE, scene, config);
  scene.preprocess(config.accel);

  const auto floor = scene.intersect(ray_t(Imath::V3f(4.0f, 5.0f, 4.0f), Imath::V3f(0.0f, -1.0f, 0.0f)), 0.001f, INF);
  ASSERT_TRUE(floor);
  EXPECT_FLOAT_EQ(floor->t, 5.0f);
  EXPECT_EQ(floor->material, scene.material("floor"));

  // inside the group
  const auto lamp = scene.intersect(ray_t(Imath::V3f(-2.0f, 5.0f, 0.0f), Imath::V3f(0.0f, -1.0f, 0.0f)), 0.001f, INF);
  ASSERT_TRUE(lamp);
  EXPECT_NEAR(lamp->t, 1.7f, 1e-4f);
  EXPECT_TRUE(lamp->material->is_emitter());

  // the rotated and moved box
  const auto box = scene.intersect(ray_t(Imath::V3f(-2.5f, 5.0f, 0.5f), Imath::V3f(0.0f, -1.0f, 0.0f)), 0.001f, INF);
  ASSERT_TRUE(box);
  EXPECT_NEAR(box->t, 4.0f, 1e-4f);
  EXPECT_EQ(box->material, scene.material("red"));
}

TEST(codec, overrides_apply_before_the_camera) {
  scene_t scene;
  render_config_t config;

  codec::scene::import(YAML::Load(MINIMAL), "", scene, config, [](render_config_t& c) {
    c.image_width  = 300;
    c.image_height = 100;
  });

  EXPECT_EQ(config.image_width, 300);
  EXPECT_NEAR(scene.camera.horizontal.length() / scene.camera.vertical.length(), 3.0f, 1e-4f);
}

TEST(codec, plain_color_background) {
  scene_t scene;
  render_config_t config;
  load(std::string(MINIMAL) + "background: [0.2, 0.3, 0.4]\n", scene, config);

  EXPECT_EQ(scene.background.type, background_t::SOLID);
  EXPECT_EQ(scene.background.top, Imath::Color3f(0.2f, 0.3f, 0.4f));
}

TEST(codec, requires_a_camera) {
  scene_t scene;
  render_config_t config;
  EXPECT_THROW(load("render: {width: 10}\n", scene, config), std::runtime_error);
}

TEST(codec, rejects_unknown_types) {
  EXPECT_THROW(load_with("primitives:\n  - {type: torus}\n"), std::runtime_error);
  EXPECT_THROW(load_with("materials:\n  m: {type: velvet}\n"), std::runtime_error);
  EXPECT_THROW(load_with("textures:\n  t: {type: plaid}\n"), std::runtime_error);
  EXPECT_THROW(load_with("render: {accel: kdtree}\n"), std::runtime_error);
}

TEST(codec, rejects_unknown_references) {
  EXPECT_THROW(load_with("primitives:\n  - {type: sphere, center: [0, 0, 0], radius: 1, material: nope}\n"), std::runtime_error);
  EXPECT_THROW(load_with("materials:\n  m: {type: lambert, albedo: nope}\n"), std::runtime_error);
}

TEST(codec, rejects_primitives_without_material) {
  EXPECT_THROW(load_with("primitives:\n  - {type: sphere, center: [0, 0, 0], radius: 1}\n"), std::runtime_error);
}

TEST(codec, rejects_malformed_values) {
  EXPECT_THROW(load_with("primitives:\n  - {type: rect, plane: xw, a: [0, 1], b: [0, 1], k: 0}\n"), std::runtime_error);
  EXPECT_THROW(load_with("primitives:\n  - {type: triangle, vertices: [[0, 0, 0]]}\n"), std::runtime_error);
  EXPECT_THROW(load_with("materials:\n  m: {type: metal, albedo: [1, 1]}\n"), std::runtime_error);
  EXPECT_THROW(load_with("primitives: {type: sphere}\n"), std::runtime_error);
}

TEST(codec, missing_file) {
  scene_t scene;
  render_config_t config;
  EXPECT_THROW(codec::scene::import("/nonexistent/scene.yaml", scene, config), std::runtime_error);
}
