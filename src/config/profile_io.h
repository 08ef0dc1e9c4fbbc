// JSON serialization of generation profiles and map skeletons.
//
// Profile files name fields exactly as GenerationProfile does. Weight tables
// are {"values": [...], "weights": [...]}, shift_weights is {"weights": [...]},
// and (min, max) bounds are two-element arrays. Unknown keys are ignored and
// missing keys keep their defaults. Map files hold name, width, height,
// spawn {"x", "y"} and waypoints [{"x", "y"}, ...].

#ifndef CAVEWALK_CONFIG_PROFILE_IO_H
#define CAVEWALK_CONFIG_PROFILE_IO_H

#include <string>
#include <string_view>

#include "config/generation_profile.h"
#include "map/map_skeleton.h"

namespace cavewalk {

/// @brief Result of loading a profile.
struct ProfileLoadResult {
  bool success = false;
  GenerationProfile profile;
  std::string error_message;  ///< "<source>: <key>: <problem>" on failure.
};

/// @brief Result of loading a map skeleton.
struct SkeletonLoadResult {
  bool success = false;
  MapSkeleton skeleton;
  std::string error_message;
};

/// @brief Parse a profile from JSON text.
///
/// Only the structure is checked here (types and shapes of known keys). Value
/// ranges are checked by validateProfile() when a run starts.
///
/// @param json JSON text.
/// @param source Name used in error messages (usually the file path).
ProfileLoadResult profileFromJson(std::string_view json, const std::string& source);

/// @brief Serialize every profile field to pretty-printed JSON.
std::string profileToJson(const GenerationProfile& profile);

/// @brief Parse a map skeleton from JSON text.
SkeletonLoadResult skeletonFromJson(std::string_view json, const std::string& source);

/// @brief Serialize a map skeleton to pretty-printed JSON.
std::string skeletonToJson(const MapSkeleton& skeleton);

/// @brief Read and parse a profile file.
ProfileLoadResult loadProfileFile(const std::string& path);

/// @brief Read and parse a map skeleton file.
SkeletonLoadResult loadSkeletonFile(const std::string& path);

/// @brief Write profileToJson() output to a file.
/// @return False if the file could not be written.
bool saveProfileFile(const GenerationProfile& profile, const std::string& path);

/// @brief Write skeletonToJson() output to a file.
/// @return False if the file could not be written.
bool saveSkeletonFile(const MapSkeleton& skeleton, const std::string& path);

}  // namespace cavewalk

#endif  // CAVEWALK_CONFIG_PROFILE_IO_H
