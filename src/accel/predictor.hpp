#pragma once

#include "state.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

/**
 * Remembers how traversals of similar rays went through a bvh. Rays are
 * hashed from a few bits of the sign, exponent and mantissa of their
 * origin and direction, so nearby rays with similar directions share
 * entries. The cache is advisory: a hint only decides which child of a
 * node is visited first, both children are still tested. Safe to share
 * between all render threads
 */
struct predictor_t {
  enum outcome_t : uint8_t {
    LEFT_FIRST,  // the closest hit was found below the left child
    RIGHT_FIRST, // the closest hit was found below the right child
    LEAF_HIT,    // the leaf contained the closest hit so far
    LEAF_MISS    // none of the primitives in the leaf were hit
  };

  static const uint32_t NUM_SHARDS = 64;
  static const size_t   DEFAULT_CAPACITY = 1 << 16;

  struct shard_t {
    std::shared_mutex mutex;
    std::unordered_map<uint64_t, uint8_t> entries;
  };

  struct stats_t {
    uint64_t lookups;
    uint64_t hints;
    uint64_t confirmed;
    uint64_t updates;
    size_t   entries;
  };

  shard_t shards[NUM_SHARDS];

  // entries per shard, a shard is cleared once it grows larger
  size_t capacity;

  std::atomic<uint64_t> lookups;
  std::atomic<uint64_t> hints;
  std::atomic<uint64_t> confirmed;
  std::atomic<uint64_t> updates;

  predictor_t(size_t capacity = DEFAULT_CAPACITY);

  predictor_t(const predictor_t&) = delete;
  predictor_t& operator=(const predictor_t&) = delete;

  /* key for a ray, shared by all nodes */
  static uint64_t hash(const ray_t& ray);

  /* key for a ray at a node */
  static uint64_t key(uint64_t ray, uint32_t node);

  /* the last outcome recorded for a ray at a node, if any */
  std::optional<outcome_t> lookup(uint64_t ray, uint32_t node);

  /* remember the outcome observed for a ray at a node */
  void record(uint64_t ray, uint32_t node, outcome_t outcome);

  void clear();

  stats_t stats();
};

namespace predictor {
  /* sign bit, followed by the top 6 bits of exponent and mantissa */
  uint16_t quantize(float v);
}
