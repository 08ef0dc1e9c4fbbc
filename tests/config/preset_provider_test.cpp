// Tests for config/preset_provider.h.

#include "config/preset_provider.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "config/profile_io.h"

namespace cavewalk {
namespace {

namespace fs = std::filesystem;

void writeText(const fs::path& path, const std::string& text) {
  std::ofstream file(path);
  file << text;
}

class DirectoryPresetProviderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    root_ = fs::temp_directory_path() / "cavewalk_preset_provider_test";
    fs::remove_all(root_);
    fs::create_directories(root_ / "profiles");
    fs::create_directories(root_ / "maps");
  }

  void TearDown() override { fs::remove_all(root_); }

  fs::path root_;
};

TEST(BuiltinPresetProviderTest, ListsBuiltinPresets) {
  BuiltinPresetProvider provider;
  auto profiles = provider.profiles();
  ASSERT_EQ(profiles.size(), 3u);
  EXPECT_EQ(profiles.count("default"), 1u);
  EXPECT_EQ(profiles.at("easy"), easyProfile());
  EXPECT_EQ(profiles.at("hard"), hardProfile());

  auto maps = provider.maps();
  ASSERT_EQ(maps.size(), 2u);
  EXPECT_EQ(maps.at("straight"), straightMapSkeleton());
  EXPECT_EQ(maps.at("default"), defaultMapSkeleton());
}

TEST_F(DirectoryPresetProviderTest, LoadsJsonFilesKeyedByName) {
  GenerationProfile wide = easyProfile();
  wide.name = "wide";
  ASSERT_TRUE(saveProfileFile(wide, (root_ / "profiles" / "wide_tunnels.json").string()));
  ASSERT_TRUE(saveSkeletonFile(straightMapSkeleton(), (root_ / "maps" / "line.json").string()));
  writeText(root_ / "profiles" / "notes.txt", "not a preset");

  DirectoryPresetProvider provider(root_.string());
  auto profiles = provider.profiles();
  ASSERT_EQ(profiles.size(), 1u);
  EXPECT_EQ(profiles.count("wide_tunnels"), 0u);
  EXPECT_EQ(profiles.at("wide"), wide);
  EXPECT_TRUE(provider.errors().empty());

  auto maps = provider.maps();
  ASSERT_EQ(maps.size(), 1u);
  EXPECT_EQ(maps.count("line"), 0u);
  EXPECT_EQ(maps.at("straight"), straightMapSkeleton());
}

TEST_F(DirectoryPresetProviderTest, UnnamedPresetFallsBackToStem) {
  writeText(root_ / "profiles" / "anonymous.json", "{\"name\": \"\", \"momentum_prob\": 0.2}");

  DirectoryPresetProvider provider(root_.string());
  auto profiles = provider.profiles();
  ASSERT_EQ(profiles.size(), 1u);
  ASSERT_EQ(profiles.count("anonymous"), 1u);
  EXPECT_FLOAT_EQ(profiles.at("anonymous").momentum_prob, 0.2f);
}

TEST_F(DirectoryPresetProviderTest, BrokenFilesAreSkippedAndReported) {
  writeText(root_ / "profiles" / "broken.json", "{\"momentum_prob\": \"x\"}");
  writeText(root_ / "profiles" / "ok.json", "{\"name\": \"ok\"}");

  DirectoryPresetProvider provider(root_.string());
  auto profiles = provider.profiles();
  ASSERT_EQ(profiles.size(), 1u);
  EXPECT_EQ(profiles.count("ok"), 1u);
  ASSERT_EQ(provider.errors().size(), 1u);
  EXPECT_NE(provider.errors()[0].find("momentum_prob"), std::string::npos);

  // Errors are reset on every call.
  provider.maps();
  EXPECT_TRUE(provider.errors().empty());
}

TEST(DirectoryPresetProviderMissingTest, MissingDirectoryContributesNothing) {
  DirectoryPresetProvider provider("/nonexistent_cavewalk_presets");
  EXPECT_TRUE(provider.profiles().empty());
  EXPECT_TRUE(provider.maps().empty());
  EXPECT_TRUE(provider.errors().empty());
}

}  // namespace
}  // namespace cavewalk
