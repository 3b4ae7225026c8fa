#include "texture.hpp"
#include "math/perlin.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {
  struct solid_texture_t : public texture_t::details_t {
    Imath::Color3f color;

    solid_texture_t(const Imath::Color3f& color)
      : color(color)
    {}
  };

  struct checker_texture_t : public texture_t::details_t {
    float scale;
    const texture_t* even;
    const texture_t* odd;

    checker_texture_t(float scale, const texture_t* even, const texture_t* odd)
      : scale(scale), even(even), odd(odd)
    {}

    Imath::Color3f value(const Imath::V2f& st, const Imath::V3f& p) const {
      const auto x = (int64_t) std::floor(scale * p.x);
      const auto y = (int64_t) std::floor(scale * p.y);
      const auto z = (int64_t) std::floor(scale * p.z);

      const auto is_even = ((x + y + z) & 1) == 0;
      return is_even ? even->value(st, p) : odd->value(st, p);
    }
  };

  struct image_texture_t : public texture_t::details_t {
    uint32_t width, height;
    std::vector<float> pixels;

    image_texture_t(uint32_t width, uint32_t height, std::vector<float> pixels)
      : width(width), height(height), pixels(std::move(pixels))
    {}

    Imath::Color3f value(const Imath::V2f& st) const {
      const auto u = std::clamp(st.x, 0.0f, 1.0f);
      // image rows are stored top down
      const auto v = 1.0f - std::clamp(st.y, 0.0f, 1.0f);

      const auto i = std::min((uint32_t) (u * width), width - 1);
      const auto j = std::min((uint32_t) (v * height), height - 1);

      const auto offset = ((size_t) j * width + i) * 3;
      return Imath::Color3f(pixels[offset], pixels[offset+1], pixels[offset+2]);
    }
  };

  struct noise_texture_t : public texture_t::details_t {
    float scale;
    perlin_t perlin;

    noise_texture_t(float scale, uint64_t seed)
      : scale(scale), perlin(seed)
    {}

    Imath::Color3f value(const Imath::V3f& p) const {
      const auto v = 0.5f * (1.0f + std::sin(scale * p.z + 10.0f * perlin.turbulence(p)));
      return Imath::Color3f(v, v, v);
    }
  };
}

texture_t::texture_t(type_t type, details_t* details)
  : type(type), details(details), id(0)
{}

texture_t::~texture_t() {
  delete details;
}

Imath::Color3f texture_t::value(const Imath::V2f& st, const Imath::V3f& p) const {
  switch (type) {
    case SOLID:
      return static_cast<const solid_texture_t*>(details)->color;
    case CHECKER:
      return static_cast<const checker_texture_t*>(details)->value(st, p);
    case IMAGE:
      return static_cast<const image_texture_t*>(details)->value(st);
    case NOISE:
      return static_cast<const noise_texture_t*>(details)->value(p);
  }
  return Imath::Color3f(0.0f);
}

texture_t* texture_t::make_solid(const Imath::Color3f& color) {
  return new texture_t(SOLID, new solid_texture_t(color));
}

texture_t* texture_t::make_checker(float scale, const texture_t* even, const texture_t* odd) {
  if (!even || !odd) {
    throw std::invalid_argument("checker texture requires two textures");
  }
  return new texture_t(CHECKER, new checker_texture_t(scale, even, odd));
}

texture_t* texture_t::make_image(uint32_t width, uint32_t height, std::vector<float> pixels) {
  if (width == 0 || height == 0) {
    throw std::invalid_argument("image texture has no pixels");
  }
  if (pixels.size() != (size_t) width * height * 3) {
    throw std::invalid_argument("image texture data doesn't match its dimensions");
  }
  return new texture_t(IMAGE, new image_texture_t(width, height, std::move(pixels)));
}

texture_t* texture_t::make_noise(float scale, uint64_t seed) {
  return new texture_t(NOISE, new noise_texture_t(scale, seed));
}
