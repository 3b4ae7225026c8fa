#include "predictor.hpp"
#include "sampling.hpp"

#include <cstring>
#include <mutex>

namespace predictor {
  uint16_t quantize(float v) {
    uint32_t bits;
    std::memcpy(&bits, &v, sizeof(bits));

    const uint16_t sign     = (bits >> 31) & 0x1;
    const uint16_t exponent = (bits >> 25) & 0x3f;
    const uint16_t mantissa = (bits >> 17) & 0x3f;

    return (sign << 15) | (exponent << 7) | mantissa;
  }
}

predictor_t::predictor_t(size_t capacity)
  : capacity(capacity)
  , lookups(0)
  , hints(0)
  , confirmed(0)
  , updates(0)
{}

uint64_t predictor_t::hash(const ray_t& ray) {
  const uint64_t px = predictor::quantize(ray.p.x);
  const uint64_t py = predictor::quantize(ray.p.y);
  const uint64_t pz = predictor::quantize(ray.p.z);
  const uint64_t dx = predictor::quantize(ray.wi.x);
  const uint64_t dy = predictor::quantize(ray.wi.y);
  const uint64_t dz = predictor::quantize(ray.wi.z);

  return (px ^ dz) | ((py ^ dy) << 16) | ((pz ^ dx) << 32);
}

uint64_t predictor_t::key(uint64_t ray, uint32_t node) {
  return sampling::splitmix64(ray ^ ((uint64_t) node << 48) ^ ((uint64_t) node * 0x9e3779b97f4a7c15ull));
}

std::optional<predictor_t::outcome_t> predictor_t::lookup(uint64_t ray, uint32_t node) {
  lookups.fetch_add(1, std::memory_order_relaxed);

  const auto k = key(ray, node);
  auto& shard = shards[k % NUM_SHARDS];

  std::shared_lock<std::shared_mutex> lock(shard.mutex);

  const auto it = shard.entries.find(k);
  if (it == shard.entries.end()) {
    return std::nullopt;
  }

  hints.fetch_add(1, std::memory_order_relaxed);
  return (outcome_t) it->second;
}

void predictor_t::record(uint64_t ray, uint32_t node, outcome_t outcome) {
  updates.fetch_add(1, std::memory_order_relaxed);

  const auto k = key(ray, node);
  auto& shard = shards[k % NUM_SHARDS];

  std::unique_lock<std::shared_mutex> lock(shard.mutex);

  auto it = shard.entries.find(k);
  if (it != shard.entries.end()) {
    if (it->second == outcome) {
      confirmed.fetch_add(1, std::memory_order_relaxed);
    }
    it->second = outcome;
    return;
  }

  if (shard.entries.size() >= capacity) {
    shard.entries.clear();
  }
  shard.entries.emplace(k, outcome);
}

void predictor_t::clear() {
  for (auto& shard : shards) {
    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    shard.entries.clear();
  }
}

predictor_t::stats_t predictor_t::stats() {
  stats_t out;
  out.lookups   = lookups.load();
  out.hints     = hints.load();
  out.confirmed = confirmed.load();
  out.updates   = updates.load();
  out.entries   = 0;

  for (auto& shard : shards) {
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    out.entries += shard.entries.size();
  }
  return out;
}
