#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace job {
  /**
   * A job that describes a set of precomputed tiles to be rendered.
   * Workers pull tiles until all of them are handed out, or the job is
   * stopped. Stopping never interrupts a tile that is being rendered
   */
  struct tiles_t {
    struct tile_t {
      uint32_t x, y;
      uint32_t w, h;

      uint32_t num_pixels() const {
        return w*h;
      }
    };

    std::vector<tile_t> tiles;

    std::atomic<uint32_t> tile;
    std::atomic<uint32_t> completed;
    std::atomic<bool>     stopped;

    inline tiles_t(std::vector<tile_t> tiles)
      : tiles(std::move(tiles)), tile(0), completed(0), stopped(false)
    {}

    inline uint32_t size() const {
      return tiles.size();
    }

    inline bool next(tile_t& out) {
      if (stopped.load()) {
        return false;
      }

      const auto t = tile++;
      if (t < tiles.size()) {
        out = tiles[t];
        return true;
      }
      return false;
    }

    /* called by workers after a tile has been written to the film */
    inline void done() {
      ++completed;
    }

    inline void stop() {
      stopped = true;
    }

    inline bool is_stopped() const {
      return stopped.load();
    }

    inline bool is_finished() const {
      return completed.load() == tiles.size();
    }

    /* covers a width by height image in row major order. tiles on the
     * right and bottom edge are clipped to the image */
    static tiles_t* make(
      uint32_t width,
      uint32_t height,
      uint32_t tile_size)
    {
      if (tile_size == 0) {
        throw std::invalid_argument("tile size must be positive");
      }

      std::vector<tile_t> tiles;
      tiles.reserve(
        ((width + tile_size - 1) / tile_size) *
        ((height + tile_size - 1) / tile_size));

      for (auto y=0u; y<height; y+=tile_size) {
        const auto th = std::min(tile_size, height - y);
        for (auto x=0u; x<width; x+=tile_size) {
          tiles.push_back({ x, y, std::min(tile_size, width - x), th });
        }
      }

      return new tiles_t(std::move(tiles));
    }
  };
}
