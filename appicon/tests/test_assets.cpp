#include <fstream>
#include <string>

#include "test_util.hpp"
#include "../common/ico.hpp"
#include "../common/image_io.hpp"
#include "../generator/assets.hpp"

#include <CppUTest/TestHarness.h>

using namespace appicon;
namespace fs = std::filesystem;

TEST_GROUP(Assets) {
  fs::path root;
  Config C;
  Logger log;
  std::string err;

  TEST_SETUP() {
    root = test::scratch_dir("assets");
    C.out_dir = (root / "fresh" / "Resources").string();
    log.set_min_level(LogLevel::ERROR);
  }

  TEST_TEARDOWN() { test::remove_dir(root); }
};

TEST(Assets, CreatesDirectoryAndBothArtifacts) {
  CHECK_FALSE(fs::exists(C.out_dir));
  CHECK_TRUE(generate_assets(C, log, err));
  CHECK_TRUE(fs::is_directory(C.out_dir));

  const fs::path ico = fs::path(C.out_dir) / "app.ico";
  const fs::path png = fs::path(C.out_dir) / "app_preview.png";
  CHECK_TRUE(fs::file_size(ico) > 0);
  CHECK_TRUE(fs::file_size(png) > 0);

  IcoFile file;
  CHECK_TRUE(read_ico(ico.string(), file, err));
  LONGS_EQUAL(6, file.entries.size());

  ImageRGBA preview;
  CHECK_TRUE(read_png(png.string(), preview, err));
  UNSIGNED_LONGS_EQUAL(256, preview.w);
  UNSIGNED_LONGS_EQUAL(256, preview.h);
}

TEST(Assets, RerunOverwritesWithIdenticalBytes) {
  CHECK_TRUE(generate_assets(C, log, err));
  auto ico = test::slurp(fs::path(C.out_dir) / "app.ico");
  auto png = test::slurp(fs::path(C.out_dir) / "app_preview.png");
  CHECK_TRUE(generate_assets(C, log, err));
  CHECK_TRUE(ico == test::slurp(fs::path(C.out_dir) / "app.ico"));
  CHECK_TRUE(png == test::slurp(fs::path(C.out_dir) / "app_preview.png"));
}

TEST(Assets, SkipExistingKeepsFilesOnDisk) {
  fs::create_directories(C.out_dir);
  const fs::path ico = fs::path(C.out_dir) / "app.ico";
  {
    std::ofstream f(ico);
    f << "placeholder";
  }
  C.skip_existing = true;
  CHECK_TRUE(generate_assets(C, log, err));
  LONGS_EQUAL(11, fs::file_size(ico));
  CHECK_TRUE(fs::exists(fs::path(C.out_dir) / "app_preview.png"));
}

TEST(Assets, InvalidConfigStopsBeforeWriting) {
  C.sizes = {16, 1024};
  CHECK_FALSE(generate_assets(C, log, err));
  CHECK_FALSE(err.empty());
  CHECK_FALSE(fs::exists(C.out_dir));
}

TEST(Assets, OversizedPreviewIsRejectedBeforeRendering) {
  C.preview_size = 100000;
  CHECK_FALSE(generate_assets(C, log, err));
  CHECK_TRUE(err.find("preview_size") != std::string::npos);
  CHECK_FALSE(fs::exists(C.out_dir));
}

TEST(Assets, UncreatableDirectoryIsAnIoError) {
  const fs::path blocker = root / "blocker";
  {
    std::ofstream f(blocker);
    f << "x";
  }
  C.out_dir = (blocker / "Resources").string();
  CHECK_FALSE(generate_assets(C, log, err));
  CHECK_FALSE(err.empty());
}
