#include "icon_renderer.hpp"
#include <algorithm>
#include "../common/ico.hpp"

namespace appicon {

const std::vector<int> kIconSizes = {16, 32, 48, 64, 128, 256};

// Square box of radius r around the pixel (cx, cy).
static Box centered(int cx, int cy, int r){
  return Box{cx-r, cy-r, cx+r, cy+r};
}

std::array<Box, 3> chart_bar_boxes(int size){
  const int cx = size/2, cy = size/2;
  const int bar_w   = std::max(2, (int)(size*0.06));
  const int spacing = (int)(size*0.08);
  const int base_y  = (int)(cy + size*0.15);
  const int bar_x   = (int)(cx - size*0.12);
  const int heights[3] = { (int)(size*0.12), (int)(size*0.18), (int)(size*0.24) };

  std::array<Box, 3> bars;
  for(int i=0;i<3;i++){
    int x = bar_x + i*spacing;
    bars[i] = Box{x, base_y-heights[i], x+bar_w, base_y};
  }
  return bars;
}

Box accent_dot_box(int size){
  if(size < kAccentMinSize) return Box{0, 0, -1, -1};
  const int cx = size/2, cy = size/2;
  const int d = std::max(2, (int)(size*0.06));
  const int x = (int)(cx + size*0.2);
  const int y = (int)(cy - size*0.25);
  return Box{x, y, x+d, y+d};
}

Rgba gradient_color(int size, int r){
  const int half = size/2;
  if(half<=0) return palette::kDarkBlue;
  return lerp(palette::kDarkBlue, palette::kTeal, (double)r/half);
}

ImageRGBA render_icon(int size){
  if(size<=0) return ImageRGBA{};
  ImageRGBA img = make_image((unsigned)size, (unsigned)size);
  const int cx = size/2, cy = size/2;

  // Gradient disc: largest circle first, smaller ones overdraw toward the centre.
  for(int r=size/2; r>0; --r){
    fill_ellipse(img, centered(cx, cy, r), gradient_color(size, r));
  }

  stroke_ellipse(img, Box{2, 2, size-3, size-3}, palette::kBorder, std::max(1, size/32));

  // Scan arcs: inner one over the top, outer one under the bottom.
  const int arc_w = std::max(2, size/20);
  stroke_arc(img, centered(cx, cy, (int)(size*0.25)), -135, -45, palette::kScanBlue, arc_w);
  stroke_arc(img, centered(cx, cy, (int)(size*0.35)), 45, 135, palette::kScanBlue, arc_w);

  for(const Box& bar: chart_bar_boxes(size)){
    fill_rect(img, bar, palette::kChartGreen);
  }

  Box dot = accent_dot_box(size);
  if(!box_empty(dot)) fill_ellipse(img, dot, palette::kAccent);

  return img;
}

bool build_icon_container(const std::vector<int>& sizes, const std::string& path, std::string& err){
  if(sizes.empty()){ err="no icon sizes requested"; return false; }
  std::vector<int> order(sizes);
  std::sort(order.begin(), order.end());
  if(std::adjacent_find(order.begin(), order.end()) != order.end()){
    err="icon sizes must be distinct";
    return false;
  }
  std::vector<ImageRGBA> frames;
  frames.reserve(order.size());
  for(int s: order){
    if(s<1 || s>256){ err="icon size "+std::to_string(s)+" outside 1..256"; return false; }
    frames.push_back(render_icon(s));
  }
  return write_ico(path, frames, err);
}

bool build_preview(int size, const std::string& path, std::string& err){
  if(size<1 || size>kMaxPreviewSize){
    err="preview size "+std::to_string(size)+" outside 1.."+std::to_string(kMaxPreviewSize);
    return false;
  }
  return write_png(path, render_icon(size), err);
}

} // namespace appicon
