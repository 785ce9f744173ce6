#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace appicon {

struct ImageRGBA {
  unsigned w=0, h=0;
  std::vector<uint8_t> rgba; // 4*w*h, row-major
};

// Fully transparent w x h image.
ImageRGBA make_image(unsigned w, unsigned h);

// PNG (8-bit RGBA) via lodepng
bool encode_png(const ImageRGBA& img, std::vector<uint8_t>& out, std::string& err);
bool decode_png(const std::vector<uint8_t>& data, ImageRGBA& img, std::string& err);
bool write_png(const std::string& path, const ImageRGBA& img, std::string& err);
bool read_png(const std::string& path, ImageRGBA& img, std::string& err);

} // namespace appicon
