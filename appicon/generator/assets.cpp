#include "assets.hpp"
#include <filesystem>
#include <system_error>
#include "../common/ico.hpp"
#include "../render/icon_renderer.hpp"

namespace fs = std::filesystem;

namespace appicon {

static bool keep_existing(const Config& C, const fs::path& p, Logger& log){
  std::error_code ec;
  if(C.skip_existing && fs::exists(p, ec)){
    log.log(LogLevel::INFO, "Keeping existing %s", p.string().c_str());
    return true;
  }
  return false;
}

bool generate_assets(const Config& C, Logger& log, std::string& err){
  if(!validate_config(C, err)) return false;

  const fs::path dir(C.out_dir);
  std::error_code ec;
  fs::create_directories(dir, ec);
  if(ec){ err="Could not create "+dir.string()+": "+ec.message(); return false; }

  const fs::path icon = dir/C.icon_name;
  if(!keep_existing(C, icon, log)){
    log.log(LogLevel::DEBUG, "Rendering %zu icon frames", C.sizes.size());
    if(!build_icon_container(C.sizes, icon.string(), err)) return false;
    IcoFile ico;
    if(!read_ico(icon.string(), ico, err)){ err="Written icon does not read back: "+err; return false; }
    for(const auto& e: ico.entries){
      log.log(LogLevel::DEBUG, "  frame %ux%u, %u bytes at %u", e.frame_w, e.frame_h, e.bytes, e.offset);
    }
    log.log(LogLevel::INFO, "Icon created: %s (%zu frames)", icon.string().c_str(), ico.entries.size());
  }

  const fs::path preview = dir/C.preview_name;
  if(!keep_existing(C, preview, log)){
    if(!build_preview(C.preview_size, preview.string(), err)) return false;
    log.log(LogLevel::INFO, "Preview created: %s", preview.string().c_str());
  }
  return true;
}

} // namespace appicon
