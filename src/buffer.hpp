#pragma once

#include <ImathColor.h>

#include <cstdint>

struct allocator_t;

/* rgb pixels of one tile, in rows from top to bottom. memory comes from
 * the allocator of the worker rendering the tile */
struct render_buffer_t {
  float* buffer; // pointer to the data in this render buffer

  uint32_t width;  // width of the render buffer in pixels
  uint32_t height; // height of the render buffer in pixels

  uint32_t xstride; // size of a single pixel in the buffer
  uint32_t ystride; // size of a line in the buffer

  render_buffer_t();

  void allocate(allocator_t& allocator, uint32_t width, uint32_t height);

  /* set a pixel in the render buffer */
  void set(uint32_t x, uint32_t y, const Imath::Color3f& c);

  Imath::Color3f get(uint32_t x, uint32_t y) const;

  inline const float* data() const {
    return buffer;
  }
};
