#include "image.hpp"
#include "texture.hpp"

#include <OpenImageIO/imageio.h>

#include <stdexcept>
#include <vector>

using namespace OIIO;

namespace codec {
  namespace image {
    texture_t* load(const std::string& path) {
      auto in = ImageInput::open(path);
      if (!in) {
        throw std::runtime_error("failed to open image " + path + ": " + OIIO::geterror());
      }

      const auto& spec = in->spec();
      const auto width    = spec.width;
      const auto height   = spec.height;
      const auto channels = spec.nchannels;

      if (width <= 0 || height <= 0 || channels <= 0) {
        throw std::runtime_error("image has no pixels: " + path);
      }

      std::vector<float> data((size_t) width * height * channels);
      if (!in->read_image(0, 0, 0, channels, TypeDesc::FLOAT, data.data())) {
        throw std::runtime_error("failed to read image " + path + ": " + in->geterror());
      }
      in->close();

      return texture_t::make_image(width, height, to_rgb(data, (size_t) width * height, channels));
    }

    std::vector<float> to_rgb(const std::vector<float>& data, size_t pixels, int channels) {
      if (channels <= 0 || data.size() < pixels * channels) {
        throw std::invalid_argument("pixel data too short for its channels");
      }

      std::vector<float> rgb(pixels * 3);
      for (size_t i=0; i<pixels; ++i) {
        const auto in = data.data() + i * channels;
        for (auto c=0; c<3; ++c) {
          rgb[i * 3 + c] = channels < 3 ? in[0] : in[c];
        }
      }
      return rgb;
    }
  }
}
