// Named profile and map presets.

#ifndef CAVEWALK_CONFIG_PRESET_PROVIDER_H
#define CAVEWALK_CONFIG_PRESET_PROVIDER_H

#include <map>
#include <string>
#include <vector>

#include "config/generation_profile.h"
#include "map/map_skeleton.h"

namespace cavewalk {

/// @brief Source of named profiles and map skeletons.
///
/// Injected into front ends; the generator core never looks presets up itself.
class IPresetProvider {
 public:
  virtual ~IPresetProvider() = default;

  /// @brief All profiles keyed by name.
  virtual std::map<std::string, GenerationProfile> profiles() const = 0;

  /// @brief All map skeletons keyed by name.
  virtual std::map<std::string, MapSkeleton> maps() const = 0;
};

/// @brief Presets compiled into the binary.
///
/// Profiles: default, easy, hard. Maps: default, straight.
class BuiltinPresetProvider : public IPresetProvider {
 public:
  std::map<std::string, GenerationProfile> profiles() const override;
  std::map<std::string, MapSkeleton> maps() const override;
};

/// @brief Presets read from JSON files under <dir>/profiles and <dir>/maps.
///
/// Each *.json file is one preset, keyed by its "name" field (the file stem
/// when the name is empty). Files that fail to
/// load are skipped and reported through errors(); a missing directory simply
/// contributes nothing.
class DirectoryPresetProvider : public IPresetProvider {
 public:
  explicit DirectoryPresetProvider(std::string root);

  std::map<std::string, GenerationProfile> profiles() const override;
  std::map<std::string, MapSkeleton> maps() const override;

  /// @brief Load errors collected by the most recent profiles()/maps() call.
  const std::vector<std::string>& errors() const { return errors_; }

 private:
  std::string root_;
  mutable std::vector<std::string> errors_;
};

}  // namespace cavewalk

#endif  // CAVEWALK_CONFIG_PRESET_PROVIDER_H
