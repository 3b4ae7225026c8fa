#pragma once

#include <cstdint>
#include <cstdlib>
#include <new>
#include <stdexcept>

/**
 * Fixed size arena for the scratch memory of a worker. Allocation bumps
 * a pointer, and memory is given back in bulk by resetting the arena or
 * unwinding an allocator_scope_t
 */
struct allocator_t {
  static const size_t ALIGNMENT = 32;

  char*  mem;
  char*  pos;
  size_t size;

  explicit allocator_t(size_t capacity)
    : mem(nullptr), pos(nullptr), size(capacity)
  {
    void* block = nullptr;
    if (posix_memalign(&block, ALIGNMENT, capacity) != 0) {
      throw std::bad_alloc();
    }
    mem = pos = static_cast<char*>(block);
  }

  ~allocator_t() {
    free(mem);
  }

  allocator_t(const allocator_t&) = delete;
  allocator_t& operator=(const allocator_t&) = delete;

  static inline size_t padding(const char* p) {
    const auto misalignment = reinterpret_cast<uintptr_t>(p) & (ALIGNMENT - 1);
    return misalignment == 0 ? 0 : ALIGNMENT - misalignment;
  }

  /* throws std::runtime_error when the arena is exhausted */
  inline char* allocate(size_t bytes) {
    char* out = pos + padding(pos);
    if (out + bytes > mem + size) {
      throw std::runtime_error("tile allocator exhausted");
    }
    pos = out + bytes;
    return out;
  }

  inline void reset() {
    pos = mem;
  }

  inline size_t used() const {
    return pos - mem;
  }
};

/* releases everything allocated during its lifetime */
struct allocator_scope_t {
  allocator_t& allocator;
  char*        mark;

  explicit allocator_scope_t(allocator_t& allocator)
    : allocator(allocator), mark(allocator.pos)
  {}

  ~allocator_scope_t() {
    allocator.pos = mark;
  }
};
