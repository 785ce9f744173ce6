#pragma once
#include <string>
#include <vector>

namespace appicon {

// Largest preview side accepted; icon frames stop at 256.
constexpr int kMaxPreviewSize = 4096;

struct Config {
  // Output
  std::string out_dir = "Resources";
  std::string icon_name = "app.ico";
  std::string preview_name = "app_preview.png";
  // Frames packed into the icon container, stored smallest first
  std::vector<int> sizes = {16, 32, 48, 64, 128, 256};
  int preview_size = 256;
  // Leave artifacts that already exist untouched
  bool skip_existing = false;
  // Logging ("" -> stderr)
  std::string log_file = "";
  std::string log_level = "info";
};

// Overrides fields of C with the keys present in the JSON file at path.
// Missing keys keep their current value.
bool load_config_json(const std::string& path, Config& C, std::string& err);

// Rejects values the generator cannot honour (empty/duplicate sizes,
// sizes outside 1..256, preview outside 1..kMaxPreviewSize, unknown log level).
bool validate_config(const Config& C, std::string& err);

} // namespace appicon
