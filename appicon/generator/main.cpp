// Application icon generator: gradient badge + scan arcs + chart bars
// Outputs Resources/app.ico (16..256 px frames) and Resources/app_preview.png.
// Build (Linux):
//   cmake -S . -B build && cmake --build build -j
// Run:
//   ./build/appicon_gen
//   ./build/appicon_gen --config appicon/config/icon.json --out Resources
#include <cstdio>
#include <filesystem>
#include <string>
#include <vector>

#include "../common/logger.hpp"
#include "../common/config.hpp"
#include "assets.hpp"
#include "cli.hpp"

namespace fs = std::filesystem;
using appicon::Logger;
using appicon::LogLevel;

int main(int argc, char** argv){
  appicon::CliOptions opt; std::string err;
  if(!appicon::parse_cli(std::vector<std::string>(argv+1, argv+argc), opt, err)){
    std::fprintf(stderr, "%s\n", err.c_str());
    appicon::print_usage(stderr);
    return 1;
  }
  if(opt.help){ appicon::print_usage(stdout); return 0; }

  Logger log("appicon_gen");
  appicon::Config C;
  if(!appicon::resolve_config(opt, C, err)){
    log.log(LogLevel::ERROR, "%s", err.c_str());
    return 1;
  }

  LogLevel level;
  if(appicon::parse_level(C.log_level, level)) log.set_min_level(level);
  if(!C.log_file.empty()){
    std::error_code ec;
    fs::path lp(C.log_file);
    if(lp.has_parent_path()) fs::create_directories(lp.parent_path(), ec);
    if(ec || !log.open(C.log_file)){
      log.log(LogLevel::ERROR, "Could not open log file %s", C.log_file.c_str());
      return 1;
    }
  }

  log.log(LogLevel::INFO, "Generating icon assets in %s (%zu frames, preview %dpx)",
          C.out_dir.c_str(), C.sizes.size(), C.preview_size);
  if(!appicon::generate_assets(C, log, err)){
    log.log(LogLevel::ERROR, "%s", err.c_str());
    return 1;
  }
  log.log(LogLevel::INFO, "Done (%u warnings).", log.count(LogLevel::WARN));
  return 0;
}
