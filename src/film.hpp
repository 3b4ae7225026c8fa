#pragma once

#include <ImathVec.h>

struct render_buffer_t;

/* destination of finished tiles. render threads call add_tile
 * concurrently, but never twice for the same pixels */
struct film_t {
  virtual ~film_t() {}

  /* 'buffer' holds 'size' pixels, which land at 'pos' in the image.
   * an exception thrown here stops the frame */
  virtual void add_tile(
    const Imath::V2i& pos
  , const Imath::V2i& size
  , const render_buffer_t& buffer) = 0;
};
