#include "medium.hpp"
#include "sampling.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <stdexcept>

namespace {
  inline uint64_t mix(uint64_t h, float v) {
    uint32_t bits;
    std::memcpy(&bits, &v, sizeof(bits));
    return sampling::splitmix64(h ^ bits);
  }

  /* identical media get identical streams, whichever scene holds them */
  uint64_t salt_of(const primitive_t& boundary, float density) {
    const auto b = boundary.bounds(0.0f, 0.0f);

    auto h = mix(0, density);
    for (auto i=0; i<3; ++i) {
      h = mix(h, b.min[i]);
      h = mix(h, b.max[i]);
    }
    return h;
  }
}

constant_medium_t::constant_medium_t(
  primitive_t::scoped_t boundary
, float density
, const material_t* phase)
  : boundary(std::move(boundary))
  , density(density)
  , neg_inv_density(-1.0f / density)
  , phase(phase)
  , salt(0)
{
  if (!this->boundary) {
    throw std::invalid_argument("medium requires a boundary");
  }
  if (!(density > 0.0f)) {
    throw std::invalid_argument("medium requires a positive density");
  }
  salt = salt_of(*this->boundary, density);
}

float constant_medium_t::xi(const ray_t& ray) const {
  return 1.0f - sampling::to_float(sampling::splitmix64(ray.seed ^ salt));
}

std::optional<interaction_t> constant_medium_t::intersect(
  const ray_t& ray
, float t_min
, float t_max) const
{
  static const float infinity = std::numeric_limits<float>::infinity();

  if (ray.is_degenerate()) {
    return std::nullopt;
  }

  // both crossings of the boundary, regardless of the query interval
  auto enter = boundary->intersect(ray, -infinity, infinity);
  if (!enter) {
    return std::nullopt;
  }

  auto exit = boundary->intersect(ray, enter->t + 0.0001f, infinity);
  if (!exit) {
    return std::nullopt;
  }

  auto t0 = std::max(enter->t, t_min);
  auto t1 = std::min(exit->t, t_max);

  if (t0 >= t1) {
    return std::nullopt;
  }

  t0 = std::max(t0, 0.0f);

  const auto length = ray.wi.length();
  const auto inside = (t1 - t0) * length;
  const auto flight = neg_inv_density * std::log(xi(ray));

  if (flight > inside) {
    return std::nullopt;
  }

  interaction_t hit;
  hit.t = t0 + flight / length;
  hit.p = ray.at(hit.t);
  // arbitrary, the phase function ignores it
  hit.n = Imath::V3f(1.0f, 0.0f, 0.0f);
  hit.front_face = true;
  hit.st = Imath::V2f(0.0f, 0.0f);
  hit.material = phase;

  return hit;
}

Imath::Box3f constant_medium_t::bounds(float time0, float time1) const {
  return boundary->bounds(time0, time1);
}
