#pragma once
#include <cstdint>
#include "../common/image_io.hpp"

namespace appicon {

struct Rgba { uint8_t r,g,b,a; };

inline bool operator==(const Rgba& x, const Rgba& y){
  return x.r==y.r && x.g==y.g && x.b==y.b && x.a==y.a;
}
inline bool operator!=(const Rgba& x, const Rgba& y){ return !(x==y); }

// Inclusive pixel bounding box. Shapes fill the continuous span
// [x0, x1+1) x [y0, y1+1); pixels are sampled at their centres.
struct Box { int x0,y0,x1,y1; };

inline bool box_empty(const Box& b){ return b.x1<b.x0 || b.y1<b.y0; }

// Out-of-range reads return transparent black.
Rgba get_px(const ImageRGBA& img, int x, int y);
// Replaces the pixel; out-of-range writes are dropped.
void set_px(ImageRGBA& img, int x, int y, Rgba c);

// Channelwise a*(1-t) + b*t, truncated toward zero.
Rgba lerp(Rgba a, Rgba b, double t);

// All primitives overwrite pixels with the ink colour (no blending)
// and clip to the image.
void fill_rect(ImageRGBA& img, const Box& box, Rgba c);
void fill_ellipse(ImageRGBA& img, const Box& box, Rgba c);
void stroke_ellipse(ImageRGBA& img, const Box& box, Rgba c, int width);

// Angles in degrees, 0 = east, increasing clockwise on screen.
// end is advanced by whole turns until end >= start.
void stroke_arc(ImageRGBA& img, const Box& box, double start_deg, double end_deg,
                Rgba c, int width);

} // namespace appicon
