#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "image_io.hpp"

namespace appicon {

// One ICONDIRENTRY plus the real size of its decoded payload.
struct IcoEntry {
  unsigned width=0, height=0;   // directory values, 0 already mapped to 256
  uint16_t planes=0;
  uint16_t bit_count=0;
  uint32_t bytes=0;
  uint32_t offset=0;
  bool png=false;               // payload starts with the PNG signature
  unsigned frame_w=0, frame_h=0;
};

struct IcoFile {
  std::vector<IcoEntry> entries;
};

// Frames are stored PNG-compressed, 32-bit, in the given order.
// Each side must be 1..256 px.
bool encode_ico(const std::vector<ImageRGBA>& frames, std::vector<uint8_t>& out, std::string& err);
bool write_ico(const std::string& path, const std::vector<ImageRGBA>& frames, std::string& err);

bool parse_ico(const std::vector<uint8_t>& data, IcoFile& ico, std::string& err);
bool read_ico(const std::string& path, IcoFile& ico, std::string& err);

} // namespace appicon
