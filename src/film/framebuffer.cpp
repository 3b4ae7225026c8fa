#include "framebuffer.hpp"
#include "buffer.hpp"

#include <stdexcept>

namespace film {
  framebuffer_t::framebuffer_t(uint32_t width, uint32_t height)
    : width(width)
    , height(height)
    , pixels((size_t) width * height * 3, 0.0f)
  {}

  void framebuffer_t::add_tile(
    const Imath::V2i& pos
  , const Imath::V2i& size
  , const render_buffer_t& buffer)
  {
    if (pos.x < 0 || pos.y < 0
      || (uint32_t) (pos.x + size.x) > width
      || (uint32_t) (pos.y + size.y) > height) {
      throw std::out_of_range("tile exceeds the framebuffer");
    }

    for (auto y=0; y<size.y; ++y) {
      for (auto x=0; x<size.x; ++x) {
        const auto c = buffer.get(x, y);
        auto p = &pixels[((size_t) (pos.y + y) * width + (pos.x + x)) * 3];
        p[0] = c.x;
        p[1] = c.y;
        p[2] = c.z;
      }
    }
  }

  Imath::Color3f framebuffer_t::pixel(uint32_t x, uint32_t y) const {
    const auto p = &pixels[((size_t) y * width + x) * 3];
    return Imath::Color3f(p[0], p[1], p[2]);
  }
}
