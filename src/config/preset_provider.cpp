// Built-in and directory-backed preset providers.

#include "config/preset_provider.h"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

#include "config/profile_io.h"

namespace cavewalk {

namespace fs = std::filesystem;

namespace {

/// @brief Sorted *.json files directly inside dir (empty if dir is missing).
std::vector<fs::path> listJsonFiles(const fs::path& dir) {
  std::vector<fs::path> files;
  std::error_code err;
  if (!fs::is_directory(dir, err)) return files;
  for (fs::directory_iterator iter(dir, err), end; !err && iter != end; iter.increment(err)) {
    if (iter->is_regular_file(err) && iter->path().extension() == ".json") {
      files.push_back(iter->path());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

}  // namespace

// ---------------------------------------------------------------------------
// BuiltinPresetProvider
// ---------------------------------------------------------------------------

std::map<std::string, GenerationProfile> BuiltinPresetProvider::profiles() const {
  std::map<std::string, GenerationProfile> result;
  result["default"] = GenerationProfile();
  result["easy"] = easyProfile();
  result["hard"] = hardProfile();
  return result;
}

std::map<std::string, MapSkeleton> BuiltinPresetProvider::maps() const {
  std::map<std::string, MapSkeleton> result;
  result["default"] = defaultMapSkeleton();
  result["straight"] = straightMapSkeleton();
  return result;
}

// ---------------------------------------------------------------------------
// DirectoryPresetProvider
// ---------------------------------------------------------------------------

DirectoryPresetProvider::DirectoryPresetProvider(std::string root) : root_(std::move(root)) {}

std::map<std::string, GenerationProfile> DirectoryPresetProvider::profiles() const {
  errors_.clear();
  std::map<std::string, GenerationProfile> result;
  for (const fs::path& file : listJsonFiles(fs::path(root_) / "profiles")) {
    ProfileLoadResult loaded = loadProfileFile(file.string());
    if (!loaded.success) {
      errors_.push_back(loaded.error_message);
      continue;
    }
    std::string key = loaded.profile.name.empty() ? file.stem().string() : loaded.profile.name;
    result[key] = std::move(loaded.profile);
  }
  return result;
}

std::map<std::string, MapSkeleton> DirectoryPresetProvider::maps() const {
  errors_.clear();
  std::map<std::string, MapSkeleton> result;
  for (const fs::path& file : listJsonFiles(fs::path(root_) / "maps")) {
    SkeletonLoadResult loaded = loadSkeletonFile(file.string());
    if (!loaded.success) {
      errors_.push_back(loaded.error_message);
      continue;
    }
    std::string key = loaded.skeleton.name.empty() ? file.stem().string() : loaded.skeleton.name;
    result[key] = std::move(loaded.skeleton);
  }
  return result;
}

}  // namespace cavewalk
