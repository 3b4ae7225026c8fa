#include "buffer.hpp"
#include "utils/allocator.hpp"

#include <cstring>

render_buffer_t::render_buffer_t()
  : buffer(nullptr)
  , width(0)
  , height(0)
  , xstride(3 * sizeof(float))
  , ystride(0)
{}

void render_buffer_t::allocate(allocator_t& allocator, uint32_t w, uint32_t h) {
  width   = w;
  height  = h;
  ystride = xstride * w;

  const auto bytes = (size_t) ystride * h;

  buffer = (float*) allocator.allocate(bytes);
  std::memset(buffer, 0, bytes);
}

void render_buffer_t::set(uint32_t x, uint32_t y, const Imath::Color3f& c) {
  auto p = buffer + (y * width + x) * 3;
  p[0] = c.x;
  p[1] = c.y;
  p[2] = c.z;
}

Imath::Color3f render_buffer_t::get(uint32_t x, uint32_t y) const {
  const auto p = buffer + (y * width + x) * 3;
  return Imath::Color3f(p[0], p[1], p[2]);
}
