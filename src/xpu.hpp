#pragma once

#include <memory>
#include <vector>

struct frame_state_t;
struct render_config_t;
struct scene_t;

/* a device that pulls tiles from a frame and renders them */
struct xpu_t {
  typedef std::unique_ptr<xpu_t> scoped_t;

  virtual ~xpu_t();

  /* returns once rendering is under way, the scene and frame state
   * must outlive the next call to join */
  virtual void start(const scene_t& scene, frame_state_t& state) = 0;

  /* blocks until the device has no more tiles to work on. if a tile
   * failed, the remaining tiles are stopped and the first error is
   * rethrown here */
  virtual void join() = 0;

  /* the devices a frame with 'config' renders on */
  static std::vector<scoped_t> discover(const render_config_t& config);
};
