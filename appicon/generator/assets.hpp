#pragma once
#include <string>
#include "../common/config.hpp"
#include "../common/logger.hpp"

namespace appicon {

// Creates C.out_dir when missing, then writes the icon container and the
// preview into it. With C.skip_existing, artifacts already on disk are kept.
bool generate_assets(const Config& C, Logger& log, std::string& err);

} // namespace appicon
