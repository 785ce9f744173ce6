#pragma once
#include <array>
#include <string>
#include <vector>
#include "../common/config.hpp"
#include "../common/image_io.hpp"
#include "../raster/draw.hpp"

namespace appicon {

// Badge palette
namespace palette {
constexpr Rgba kDarkBlue   {20, 55, 90, 255};
constexpr Rgba kTeal       {26, 82, 118, 255};
constexpr Rgba kScanBlue   {200, 230, 255, 255};
constexpr Rgba kChartGreen {100, 200, 150, 255};
constexpr Rgba kBorder     {255, 255, 255, 100};
constexpr Rgba kAccent     {255, 255, 255, 200};
} // namespace palette

// Frame sizes packed into the application icon.
extern const std::vector<int> kIconSizes;

// Dot is drawn from this size upward.
constexpr int kAccentMinSize = 48;

// Three chart bars, left to right, ascending height.
std::array<Box, 3> chart_bar_boxes(int size);

// Box of the accent dot; empty box when size < kAccentMinSize.
Box accent_dot_box(int size);

// Colour the gradient disc uses for the circle of radius r (1 <= r <= size/2).
Rgba gradient_color(int size, int r);

// Renders the badge: gradient disc, border ring, two scan arcs,
// chart bars, accent dot. size <= 0 yields an empty image.
ImageRGBA render_icon(int size);

// Renders every size and writes one ICO at path, frames stored ascending.
// The directory holding path must already exist.
bool build_icon_container(const std::vector<int>& sizes, const std::string& path, std::string& err);

// Renders one frame (1..kMaxPreviewSize px) and writes it as a standalone PNG.
bool build_preview(int size, const std::string& path, std::string& err);

} // namespace appicon
