#include "file.hpp"

#include <OpenImageIO/imagebuf.h>

#include <stdexcept>

using namespace OIIO;

namespace film {
  file_t::file_t(uint32_t width, uint32_t height, const std::string& path)
    : framebuffer_t(width, height)
    , path(path)
  {}

  file_t::~file_t() {
  }

  void file_t::finalize() {
    ImageBuf image(ImageSpec(width, height, 3, TypeDesc::FLOAT));

    image.set_pixels(
      ROI(0, width, 0, height, 0, 1, 0, 3),
      TypeDesc::FLOAT,
      pixels.data());

    if (!image.write(path)) {
      throw std::runtime_error("failed to write " + path + ": " + image.geterror());
    }
  }
}
