#pragma once
#include <cstdio>
#include <string>
#include <vector>
#include "../common/config.hpp"

namespace appicon {

struct CliOptions {
  std::string config_path;  // empty: built-in defaults
  std::string out_dir;      // empty: keep the config's out_dir
  bool help{false};
};

void print_usage(std::FILE* out);

// args excludes the program name. Unknown flags and flags missing their value fail.
bool parse_cli(const std::vector<std::string>& args, CliOptions& opt, std::string& err);

// Defaults, then the --config file, then --out.
bool resolve_config(const CliOptions& opt, Config& C, std::string& err);

} // namespace appicon
