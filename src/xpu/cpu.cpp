#include "cpu.hpp"

#include "buffer.hpp"
#include "film.hpp"
#include "options.hpp"
#include "sampling.hpp"
#include "scene.hpp"
#include "state.hpp"

#include "jobs/tiles.hpp"
#include "kernels/cpu/camera.hpp"
#include "kernels/cpu/spt.hpp"
#include "math/sampling.hpp"

#include "utils/allocator.hpp"
#include "utils/color.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

struct tile_renderer_t {
  const render_config_t& config;
  const scene_t&         scene;
  frame_state_t&         frame;

  // rendering kernel functions
  camera::perspective_kernel_t camera_rays;
  spt::integrator_t            integrate;

  sampler_t sampler;

  // per tile state
  allocator_t allocator;

  // output buffer for the rendered tile
  render_buffer_t buffer;

  inline tile_renderer_t(const render_config_t& config, const scene_t& scene, frame_state_t& frame)
    : config(config)
    , scene(scene)
    , frame(frame)
    , integrate(&scene, config.max_depth, frame.predictor)
    , sampler(config.random_seed)
    , allocator(allocator_size(config))
  {}

  /* room for the largest tile, which is clipped to the image */
  static inline size_t allocator_size(const render_config_t& config) {
    const auto w = (size_t) std::min(config.tile_size, config.image_width);
    const auto h = (size_t) std::min(config.tile_size, config.image_height);
    return w * h * 3 * sizeof(float) + allocator_t::ALIGNMENT;
  }

  /* average of all samples of a pixel, in linear color */
  inline Imath::Color3f render_pixel(uint32_t px, uint32_t py) {
    const auto width  = (uint32_t) config.image_width;
    const auto height = (uint32_t) config.image_height;
    const auto spp    = (uint32_t) config.samples_per_pixel;

    sampler.start_pixel(px, py, width);

    Imath::Color3f sum(0.0f);
    for (auto i=0u; i<spp; ++i) {
      const auto offset = sample::stratified_2d(i, spp, sampler.sample2());

      // image rows go down, t goes up
      const auto s = (px + offset.x) / (float) width;
      const auto t = ((height - 1 - py) + offset.y) / (float) height;

      const auto ray = camera_rays(scene.camera, s, t, sampler);
      const auto l   = integrate.li(ray, sampler);

      // broken samples count as black
      if (color::is_finite(l)) {
        sum += l;
      }
    }

    return sum / (float) spp;
  }

  inline void render_tile(const job::tiles_t::tile_t& tile) {
    allocator_scope_t tile_scope(allocator);
    buffer.allocate(allocator, tile.w, tile.h);

    for (auto y=0u; y<tile.h; ++y) {
      for (auto x=0u; x<tile.w; ++x) {
        const auto l = render_pixel(tile.x + x, tile.y + y);
        buffer.set(x, y, color::gamma(l, config.gamma));
      }
    }

    frame.film->add_tile(
      Imath::V2i(tile.x, tile.y)
    , Imath::V2i(tile.w, tile.h)
    , buffer);

    frame.tiles->done();
  }
};

struct cpu_t::details_t {
  render_config_t config;

  std::vector<std::thread> threads;

  std::mutex         error_mutex;
  std::exception_ptr error;

  details_t(const render_config_t& config)
    : config(config)
  {}

  inline void render(const scene_t& scene, frame_state_t& frame) {
    tile_renderer_t renderer(config, scene, frame);

    job::tiles_t::tile_t tile;
    while (frame.tiles->next(tile)) {
      renderer.render_tile(tile);
    }
  }

  /* remember the first error, and stop handing out tiles */
  inline void fail(frame_state_t& frame, std::exception_ptr e) {
    frame.tiles->stop();

    std::lock_guard<std::mutex> lock(error_mutex);
    if (!error) {
      error = e;
    }
  }
};

cpu_t::cpu_t(const render_config_t& config)
  : details(nullptr)
  , concurrency(config.thread_count)
{
  config.validate();
  details = new details_t(config);
}

cpu_t::~cpu_t() {
  for (auto& thread : details->threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  delete details;
}

void cpu_t::start(const scene_t& scene, frame_state_t& frame) {
  details->error = nullptr;

  try {
    for (auto i=0u; i<concurrency; ++i) {
      details->threads.push_back(std::thread(
        [this](const scene_t& scene, frame_state_t& frame) {
          try {
            details->render(scene, frame);
          }
          catch (...) {
            details->fail(frame, std::current_exception());
          }
        }, std::cref(scene), std::ref(frame)));
    }
  }
  catch (...) {
    // no thread may outlive a failed start
    frame.tiles->stop();
    for (auto& thread : details->threads) {
      thread.join();
    }
    details->threads.clear();
    details->error = nullptr;
    throw;
  }
}

void cpu_t::join() {
  for (auto& thread : details->threads) {
    thread.join();
  }
  details->threads.clear();

  if (details->error) {
    auto error = details->error;
    details->error = nullptr;
    std::rethrow_exception(error);
  }
}
