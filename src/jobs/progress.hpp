#pragma once

#include "tiles.hpp"

#include <atomic>
#include <chrono>
#include <ostream>
#include <thread>

namespace job {
  /**
   * Prints the number of finished tiles of a job from a background thread,
   * until stopped or destroyed. The last line is printed after the thread
   * has seen the stop request
   */
  struct progress_t {
    const tiles_t&            tiles;
    std::ostream&             out;
    std::chrono::milliseconds interval;

    std::atomic<bool> running;
    std::thread       thread;

    progress_t(
      const tiles_t& tiles
    , std::ostream& out
    , std::chrono::milliseconds interval = std::chrono::milliseconds(250))
      : tiles(tiles), out(out), interval(interval), running(true)
    {
      thread = std::thread([this]() {
        while (running) {
          this->out << "\rTiles: " << this->tiles.completed.load() << "/" << this->tiles.size() << std::flush;
          std::this_thread::sleep_for(this->interval);
        }
        this->out << "\rTiles: " << this->tiles.completed.load() << "/" << this->tiles.size() << std::endl;
      });
    }

    ~progress_t() {
      stop();
    }

    progress_t(const progress_t&) = delete;
    progress_t& operator=(const progress_t&) = delete;

    inline void stop() {
      running = false;
      if (thread.joinable()) {
        thread.join();
      }
    }
  };
}
