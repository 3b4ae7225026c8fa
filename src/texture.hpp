#pragma once

#include <ImathColor.h>
#include <ImathVec.h>

#include <cstdint>
#include <vector>

/**
 * Textures map a surface coordinate and a point in space onto a color.
 * They are immutable once created, and never own the textures they
 * reference
 */
struct texture_t {
  enum type_t {
    SOLID, // constant color
    CHECKER, // alternates between two textures in a 3d grid
    IMAGE, // lookup into decoded rgb pixels
    NOISE // perlin turbulence marble
  } type;

  struct details_t {
    virtual ~details_t()
    {}
  } *details;

  uint32_t id;

  texture_t(type_t type, details_t* details);
  ~texture_t();

  texture_t(const texture_t&) = delete;
  texture_t& operator=(const texture_t&) = delete;

  /* evaluate the texture at surface coordinates 'st' and point 'p' */
  Imath::Color3f value(const Imath::V2f& st, const Imath::V3f& p) const;

  static texture_t* make_solid(const Imath::Color3f& color);

  /* 'even' is used where the sum of the cell coordinates of
   * floor(scale * p) is even, 'odd' everywhere else */
  static texture_t* make_checker(float scale, const texture_t* even, const texture_t* odd);

  /* 'pixels' holds width * height rgb triples, stored top row first.
   * throws std::invalid_argument when the data doesn't match the size */
  static texture_t* make_image(uint32_t width, uint32_t height, std::vector<float> pixels);

  static texture_t* make_noise(float scale, uint64_t seed);
};
