#pragma once

#include "xpu.hpp"

#include <cstdint>

/* a pool of host threads, each pulling tiles until the frame runs out
 * of them or is stopped. throws std::invalid_argument for an invalid
 * render config */
struct cpu_t : public xpu_t {
  struct details_t;

  details_t* details;
  uint32_t   concurrency;

  explicit cpu_t(const render_config_t& config);
  ~cpu_t();

  cpu_t(const cpu_t&) = delete;
  cpu_t& operator=(const cpu_t&) = delete;

  void start(const scene_t& scene, frame_state_t& state) override;
  void join() override;
};
