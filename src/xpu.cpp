#include "xpu.hpp"
#include "xpu/cpu.hpp"

xpu_t::~xpu_t() {
}

std::vector<xpu_t::scoped_t> xpu_t::discover(const render_config_t& config) {
  std::vector<scoped_t> out;
  out.emplace_back(new cpu_t(config));
  return out;
}
