#pragma once

#include <cstddef>
#include <string>
#include <vector>

struct texture_t;

namespace codec {
  namespace image {
    /**
     * ! Decodes the image at 'path' into an image texture. Images with
     * fewer than three channels are expanded to gray, extra channels
     * are dropped. Throws std::runtime_error if the file can't be read
     */
    texture_t* load(const std::string& path);

    /* interleaved pixels with 'channels' channels to rgb. one and two
     * channel data is gray, with or without alpha */
    std::vector<float> to_rgb(const std::vector<float>& data, size_t pixels, int channels);
  }
}
