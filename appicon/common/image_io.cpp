#include "image_io.hpp"
#include <lodepng.h>

namespace appicon {

ImageRGBA make_image(unsigned w, unsigned h){
  ImageRGBA img;
  img.w=w; img.h=h;
  img.rgba.assign(4ull*w*h, 0);
  return img;
}

static std::string png_error(const char* what, unsigned code){
  return std::string(what)+" error "+std::to_string(code)+": "+lodepng_error_text(code);
}

bool encode_png(const ImageRGBA& img, std::vector<uint8_t>& out, std::string& err){
  if(img.rgba.size() != 4ull*img.w*img.h){ err="PNG encode: pixel buffer does not match "+std::to_string(img.w)+"x"+std::to_string(img.h); return false; }
  // Keep frames 32-bit RGBA even when fewer colours would fit a palette.
  lodepng::State state;
  state.info_raw.colortype = LCT_RGBA;
  state.info_raw.bitdepth = 8;
  state.info_png.color.colortype = LCT_RGBA;
  state.info_png.color.bitdepth = 8;
  state.encoder.auto_convert = 0;
  std::vector<unsigned char> png;
  unsigned code = lodepng::encode(png, img.rgba, img.w, img.h, state);
  if(code){ err=png_error("PNG encode", code); return false; }
  out.assign(png.begin(), png.end());
  return true;
}

bool decode_png(const std::vector<uint8_t>& data, ImageRGBA& img, std::string& err){
  std::vector<unsigned char> px;
  unsigned w=0, h=0;
  unsigned code = lodepng::decode(px, w, h, data, LCT_RGBA, 8);
  if(code){ err=png_error("PNG decode", code); return false; }
  img.w=w; img.h=h;
  img.rgba.assign(px.begin(), px.end());
  return true;
}

bool write_png(const std::string& path, const ImageRGBA& img, std::string& err){
  std::vector<uint8_t> png;
  if(!encode_png(img, png, err)) return false;
  unsigned code = lodepng::save_file(png, path);
  if(code){ err=png_error("PNG write", code)+" ("+path+")"; return false; }
  return true;
}

bool read_png(const std::string& path, ImageRGBA& img, std::string& err){
  std::vector<unsigned char> data;
  unsigned code = lodepng::load_file(data, path);
  if(code){ err=png_error("PNG read", code)+" ("+path+")"; return false; }
  return decode_png(data, img, err);
}

} // namespace appicon
