#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <vector>
#include <unistd.h>

#include <CppUTest/SimpleString.h>

#include "../raster/draw.hpp"

namespace appicon {

inline SimpleString StringFrom(const Rgba& c) {
  return StringFromFormat("(%u, %u, %u, %u)", c.r, c.g, c.b, c.a);
}

namespace test {

// Fresh, empty directory under the system temp dir; unique per process and tag.
inline std::filesystem::path scratch_dir(const std::string& tag) {
  namespace fs = std::filesystem;
  std::error_code ec;
  fs::path p = fs::temp_directory_path(ec) / ("appicon_test_" + std::to_string(::getpid()) + "_" + tag);
  fs::remove_all(p, ec);
  fs::create_directories(p, ec);
  return p;
}

inline void remove_dir(const std::filesystem::path& p) {
  std::error_code ec;
  std::filesystem::remove_all(p, ec);
}

inline std::vector<uint8_t> slurp(const std::filesystem::path& p) {
  std::ifstream f(p, std::ios::binary);
  return std::vector<uint8_t>((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

}  // namespace test
}  // namespace appicon
