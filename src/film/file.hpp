#pragma once

#include "framebuffer.hpp"

#include <memory>
#include <string>

namespace film {
  /* collects tiles in a framebuffer, and writes it to an image file
   * once the frame is done. the file format follows from the extension */
  struct file_t : public framebuffer_t {
    std::string path;

    file_t(uint32_t width, uint32_t height, const std::string& path);
    ~file_t();

    /* throws std::runtime_error if the image can't be written */
    void finalize();
  };
}
