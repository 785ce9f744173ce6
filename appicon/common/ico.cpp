#include "ico.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <utility>

namespace appicon {

static constexpr size_t kDirSize = 6;
static constexpr size_t kEntrySize = 16;
static const uint8_t kPngSig[8] = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};

static void put16(std::vector<uint8_t>& b, uint16_t v){
  b.push_back((uint8_t)(v & 0xFF)); b.push_back((uint8_t)((v >> 8) & 0xFF));
}
static void put32(std::vector<uint8_t>& b, uint32_t v){
  b.push_back((uint8_t)(v & 0xFF)); b.push_back((uint8_t)((v >> 8) & 0xFF));
  b.push_back((uint8_t)((v >> 16) & 0xFF)); b.push_back((uint8_t)((v >> 24) & 0xFF));
}
static uint16_t get16(const std::vector<uint8_t>& b, size_t o){
  return (uint16_t)(b[o] | (b[o+1] << 8));
}
static uint32_t get32(const std::vector<uint8_t>& b, size_t o){
  return (uint32_t)b[o] | ((uint32_t)b[o+1] << 8) | ((uint32_t)b[o+2] << 16) | ((uint32_t)b[o+3] << 24);
}

bool encode_ico(const std::vector<ImageRGBA>& frames, std::vector<uint8_t>& out, std::string& err){
  if(frames.empty()){ err="ICO needs at least one frame"; return false; }
  if(frames.size() > 0xFFFF){ err="too many ICO frames"; return false; }

  std::vector<std::vector<uint8_t>> payloads;
  payloads.reserve(frames.size());
  for(const auto& f: frames){
    if(f.w<1 || f.w>256 || f.h<1 || f.h>256){
      err="ICO frame "+std::to_string(f.w)+"x"+std::to_string(f.h)+" outside 1..256";
      return false;
    }
    std::vector<uint8_t> png;
    if(!encode_png(f, png, err)) return false;
    payloads.push_back(std::move(png));
  }

  std::vector<uint8_t> b;
  // ICONDIR
  put16(b, 0);
  put16(b, 1);
  put16(b, (uint16_t)frames.size());
  // ICONDIRENTRY, width/height 256 stored as 0
  uint32_t offset = (uint32_t)(kDirSize + kEntrySize*frames.size());
  for(size_t i=0;i<frames.size();i++){
    b.push_back((uint8_t)(frames[i].w>=256 ? 0 : frames[i].w));
    b.push_back((uint8_t)(frames[i].h>=256 ? 0 : frames[i].h));
    b.push_back(0);
    b.push_back(0);
    put16(b, 1);
    put16(b, 32);
    put32(b, (uint32_t)payloads[i].size());
    put32(b, offset);
    offset += (uint32_t)payloads[i].size();
  }
  for(const auto& p: payloads) b.insert(b.end(), p.begin(), p.end());
  out.swap(b);
  return true;
}

bool write_ico(const std::string& path, const std::vector<ImageRGBA>& frames, std::string& err){
  std::vector<uint8_t> bytes;
  if(!encode_ico(frames, bytes, err)) return false;
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if(!f){ err="Could not open "+path+" for writing"; return false; }
  f.write(reinterpret_cast<const char*>(bytes.data()), (std::streamsize)bytes.size());
  f.flush();
  if(!f){ err="Write failed: "+path; return false; }
  return true;
}

bool parse_ico(const std::vector<uint8_t>& data, IcoFile& ico, std::string& err){
  if(data.size() < kDirSize){ err="ICO truncated: no header"; return false; }
  if(get16(data,0)!=0 || get16(data,2)!=1){ err="not an ICO file (bad reserved/type)"; return false; }
  size_t count = get16(data,4);
  if(data.size() < kDirSize + kEntrySize*count){ err="ICO truncated: directory"; return false; }

  IcoFile parsed;
  for(size_t i=0;i<count;i++){
    size_t o = kDirSize + kEntrySize*i;
    IcoEntry e;
    e.width  = data[o+0] ? data[o+0] : 256;
    e.height = data[o+1] ? data[o+1] : 256;
    e.planes = get16(data, o+4);
    e.bit_count = get16(data, o+6);
    e.bytes  = get32(data, o+8);
    e.offset = get32(data, o+12);
    if((uint64_t)e.offset + e.bytes > data.size()){
      err="ICO frame "+std::to_string(i)+" runs past end of file";
      return false;
    }
    e.png = e.bytes >= sizeof(kPngSig) && std::equal(kPngSig, kPngSig+sizeof(kPngSig), data.begin()+e.offset);
    if(e.png){
      std::vector<uint8_t> payload(data.begin()+e.offset, data.begin()+e.offset+e.bytes);
      ImageRGBA frame;
      if(!decode_png(payload, frame, err)){ err="ICO frame "+std::to_string(i)+": "+err; return false; }
      e.frame_w = frame.w;
      e.frame_h = frame.h;
    } else {
      // BITMAPINFOHEADER; height counts the XOR and AND masks together
      if(e.bytes < 40 || get32(data, e.offset) != 40){
        err="ICO frame "+std::to_string(i)+" is neither PNG nor BMP";
        return false;
      }
      e.frame_w = get32(data, e.offset+4);
      e.frame_h = get32(data, e.offset+8) / 2;
    }
    parsed.entries.push_back(e);
  }
  ico = std::move(parsed);
  return true;
}

bool read_ico(const std::string& path, IcoFile& ico, std::string& err){
  std::ifstream f(path, std::ios::binary);
  if(!f){ err="Could not open "+path; return false; }
  std::vector<uint8_t> data((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  return parse_ico(data, ico, err);
}

} // namespace appicon
