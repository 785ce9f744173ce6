#include "cli.hpp"

namespace appicon {

void print_usage(std::FILE* out){
  std::fprintf(out, "Usage: appicon_gen [--config path/to/icon.json] [--out dir]\n");
}

bool parse_cli(const std::vector<std::string>& args, CliOptions& opt, std::string& err){
  for(size_t i=0;i<args.size();i++){
    const std::string& a=args[i];
    if(a=="-h"||a=="--help"){ opt.help=true; return true; }
    if(a=="--config" || a=="--out"){
      if(i+1>=args.size() || args[i+1].empty()){ err="Missing value for "+a; return false; }
      (a=="--config" ? opt.config_path : opt.out_dir) = args[++i];
      continue;
    }
    err="Unknown argument: "+a;
    return false;
  }
  return true;
}

bool resolve_config(const CliOptions& opt, Config& C, std::string& err){
  if(!opt.config_path.empty() && !load_config_json(opt.config_path, C, err)){
    err="Config load failed: "+err;
    return false;
  }
  if(!opt.out_dir.empty()) C.out_dir=opt.out_dir;
  return true;
}

} // namespace appicon
