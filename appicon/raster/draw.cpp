#include "draw.hpp"
#include <algorithm>
#include <cmath>

namespace appicon {

Rgba get_px(const ImageRGBA& img, int x, int y){
  if(x<0 || y<0 || x>=(int)img.w || y>=(int)img.h) return Rgba{0,0,0,0};
  const uint8_t* p=&img.rgba[4ull*((size_t)y*img.w+x)];
  return Rgba{p[0],p[1],p[2],p[3]};
}

void set_px(ImageRGBA& img, int x, int y, Rgba c){
  if(x<0 || y<0 || x>=(int)img.w || y>=(int)img.h) return;
  uint8_t* p=&img.rgba[4ull*((size_t)y*img.w+x)];
  p[0]=c.r; p[1]=c.g; p[2]=c.b; p[3]=c.a;
}

Rgba lerp(Rgba a, Rgba b, double t){
  auto mix=[t](uint8_t u, uint8_t v){
    return (uint8_t)std::clamp((int)(u*(1.0-t) + v*t), 0, 255);
  };
  return Rgba{mix(a.r,b.r), mix(a.g,b.g), mix(a.b,b.b), mix(a.a,b.a)};
}

// Ellipse inscribed in a box, in continuous coordinates.
struct Ellipse { double cx,cy,rx,ry; };

static Ellipse inscribed(const Box& b){
  return Ellipse{ (b.x0+b.x1+1)/2.0, (b.y0+b.y1+1)/2.0,
                  (b.x1-b.x0+1)/2.0, (b.y1-b.y0+1)/2.0 };
}

// dx^2/rx^2 + dy^2/ry^2 <= 1 without dividing; exact for half-pixel inputs.
static inline bool inside(double dx, double dy, double rx, double ry){
  if(rx<=0 || ry<=0) return false;
  return dx*dx*ry*ry + dy*dy*rx*rx <= rx*rx*ry*ry;
}

// Row range of the box clipped to the image; false when nothing is visible.
static bool clip(const ImageRGBA& img, const Box& b, int& x0, int& y0, int& x1, int& y1){
  if(box_empty(b)) return false;
  x0=std::max(0,b.x0); y0=std::max(0,b.y0);
  x1=std::min((int)img.w-1,b.x1); y1=std::min((int)img.h-1,b.y1);
  return x0<=x1 && y0<=y1;
}

void fill_rect(ImageRGBA& img, const Box& box, Rgba c){
  int x0,y0,x1,y1;
  if(!clip(img, box, x0,y0,x1,y1)) return;
  for(int y=y0; y<=y1; ++y){
    size_t i = 4ull*((size_t)y*img.w + x0);
    for(int x=x0; x<=x1; ++x, i+=4){
      img.rgba[i+0]=c.r; img.rgba[i+1]=c.g; img.rgba[i+2]=c.b; img.rgba[i+3]=c.a;
    }
  }
}

void fill_ellipse(ImageRGBA& img, const Box& box, Rgba c){
  int x0,y0,x1,y1;
  if(!clip(img, box, x0,y0,x1,y1)) return;
  const Ellipse e = inscribed(box);
  #pragma omp parallel for schedule(static)
  for(int y=y0; y<=y1; ++y){
    double dy = y+0.5-e.cy;
    for(int x=x0; x<=x1; ++x){
      if(inside(x+0.5-e.cx, dy, e.rx, e.ry)) set_px(img, x, y, c);
    }
  }
}

// Shared by stroke_ellipse and stroke_arc. span<0 means the full turn.
static void stroke(ImageRGBA& img, const Box& box, double start_deg, double span,
                   Rgba c, int width){
  int x0,y0,x1,y1;
  if(!clip(img, box, x0,y0,x1,y1)) return;
  if(width<1) width=1;
  const Ellipse e = inscribed(box);
  const double irx = e.rx-width, iry = e.ry-width;
  #pragma omp parallel for schedule(static)
  for(int y=y0; y<=y1; ++y){
    double dy = y+0.5-e.cy;
    for(int x=x0; x<=x1; ++x){
      double dx = x+0.5-e.cx;
      if(!inside(dx, dy, e.rx, e.ry) || inside(dx, dy, irx, iry)) continue;
      if(span>=0){
        double a = std::atan2(dy, dx)*180.0/M_PI;
        double rel = std::fmod(a-start_deg, 360.0);
        if(rel<0) rel += 360.0;
        if(rel>span) continue;
      }
      set_px(img, x, y, c);
    }
  }
}

void stroke_ellipse(ImageRGBA& img, const Box& box, Rgba c, int width){
  stroke(img, box, 0.0, -1.0, c, width);
}

void stroke_arc(ImageRGBA& img, const Box& box, double start_deg, double end_deg,
                Rgba c, int width){
  while(end_deg<start_deg) end_deg += 360.0;
  double span = end_deg-start_deg;
  if(span>=360.0) span = -1.0;
  stroke(img, box, start_deg, span, c, width);
}

} // namespace appicon
