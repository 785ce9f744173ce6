#include <fstream>
#include <string>
#include <vector>

#include "test_util.hpp"
#include "../generator/cli.hpp"

#include <CppUTest/TestHarness.h>

using namespace appicon;
namespace fs = std::filesystem;

TEST_GROUP(Cli) {
  CliOptions opt;
  Config C;
  std::string err;
  fs::path dir;

  TEST_SETUP() { dir = test::scratch_dir("cli"); }

  TEST_TEARDOWN() { test::remove_dir(dir); }
};

TEST(Cli, NoArgumentsKeepDefaults) {
  CHECK_TRUE(parse_cli({}, opt, err));
  CHECK_FALSE(opt.help);
  CHECK_TRUE(opt.config_path.empty());
  CHECK_TRUE(resolve_config(opt, C, err));
  STRCMP_EQUAL("Resources", C.out_dir.c_str());
}

TEST(Cli, HelpStopsParsing) {
  CHECK_TRUE(parse_cli({"--help", "--bogus"}, opt, err));
  CHECK_TRUE(opt.help);
  CliOptions short_form;
  CHECK_TRUE(parse_cli({"-h"}, short_form, err));
  CHECK_TRUE(short_form.help);
}

TEST(Cli, UnknownArgumentFails) {
  CHECK_FALSE(parse_cli({"--out", "x", "--verbose"}, opt, err));
  STRCMP_EQUAL("Unknown argument: --verbose", err.c_str());
}

TEST(Cli, FlagWithoutValueFails) {
  CHECK_FALSE(parse_cli({"--config"}, opt, err));
  CHECK_TRUE(err.find("--config") != std::string::npos);
  err.clear();
  CHECK_FALSE(parse_cli({"--out", ""}, opt, err));
  CHECK_TRUE(err.find("--out") != std::string::npos);
}

TEST(Cli, OutOverridesDefaultDirectory) {
  CHECK_TRUE(parse_cli({"--out", "build/res"}, opt, err));
  CHECK_TRUE(resolve_config(opt, C, err));
  STRCMP_EQUAL("build/res", C.out_dir.c_str());
  LONGS_EQUAL(6, C.sizes.size());
}

TEST(Cli, OutOverridesConfigFile) {
  const fs::path cfg = dir / "icon.json";
  {
    std::ofstream f(cfg);
    f << R"({"out_dir": "from_json", "preview_size": 64})";
  }
  CHECK_TRUE(parse_cli({"--config", cfg.string(), "--out", "from_flag"}, opt, err));
  CHECK_TRUE(resolve_config(opt, C, err));
  STRCMP_EQUAL("from_flag", C.out_dir.c_str());
  LONGS_EQUAL(64, C.preview_size);

  Config plain;
  CliOptions only_config;
  CHECK_TRUE(parse_cli({"--config", cfg.string()}, only_config, err));
  CHECK_TRUE(resolve_config(only_config, plain, err));
  STRCMP_EQUAL("from_json", plain.out_dir.c_str());
}

TEST(Cli, MissingConfigFileFails) {
  CHECK_TRUE(parse_cli({"--config", (dir / "absent" / "icon.json").string()}, opt, err));
  CHECK_FALSE(resolve_config(opt, C, err));
  CHECK_TRUE(err.find("Config load failed") != std::string::npos);
  CHECK_TRUE(err.find("icon.json") != std::string::npos);
}
