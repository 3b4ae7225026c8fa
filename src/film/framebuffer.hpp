#pragma once

#include "film.hpp"

#include <ImathColor.h>

#include <cstdint>
#include <vector>

namespace film {
  /* width * height rgb float triples, stored row major from the top
   * row down. pixels no tile has been written to stay black */
  struct framebuffer_t : public film_t {
    uint32_t width;
    uint32_t height;

    std::vector<float> pixels;

    framebuffer_t(uint32_t width, uint32_t height);

    void add_tile(
      const Imath::V2i& pos
    , const Imath::V2i& size
    , const render_buffer_t& buffer) override;

    Imath::Color3f pixel(uint32_t x, uint32_t y) const;

    inline const float* data() const {
      return pixels.data();
    }
  };
}
