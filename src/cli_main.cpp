/// @file
/// @brief CLI entry point for the cavewalk level generator.

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <map>
#include <string>
#include <utility>

#include "config/preset_provider.h"
#include "config/profile_io.h"
#include "generator.h"
#include "map/grid_io.h"

namespace {

/// @brief Command-line options parsed from argv.
struct CliOptions {
  uint32_t seed = 0;
  size_t max_steps = 20000;
  std::string profile = "default";
  std::string map = "default";
  std::string preset_dir;
  std::string output = "level.txt";
  std::string save_profile;
  std::string save_map;
  bool list = false;
  bool json_output = false;
  bool verbose = false;
};

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("cavewalk_cli - Procedural Platformer Level Generator\n\n");
  std::printf("Usage: cavewalk_cli [options]\n\n");
  std::printf("Options:\n");
  std::printf("  --seed N            Random seed (0 = auto)\n");
  std::printf("  --steps N           Walker step budget (default 20000)\n");
  std::printf("  --profile NAME|FILE Generation profile preset or JSON file\n");
  std::printf("  --map NAME|FILE     Map skeleton preset or JSON file\n");
  std::printf("  --preset-dir DIR    Extra presets from DIR/profiles and DIR/maps\n");
  std::printf("  --list              List available presets\n");
  std::printf("  --json              Also write a JSON report next to the output\n");
  std::printf("  --save-profile FILE Write the resolved profile as JSON\n");
  std::printf("  --save-map FILE     Write the resolved map skeleton as JSON\n");
  std::printf("  --verbose           Log generation diagnostics\n");
  std::printf("  -o FILE             Output file path (ASCII grid)\n");
  std::printf("  --help              Show this help\n");
}

/// @brief Parse command-line arguments into CliOptions.
/// @param argc Argument count from main().
/// @param argv Argument vector from main().
/// @param opts Output structure populated with parsed values.
/// @return False if --help was requested (caller should exit cleanly).
bool parseArgs(int argc, char* argv[], CliOptions& opts) {
  for (int idx = 1; idx < argc; ++idx) {
    if (std::strcmp(argv[idx], "--help") == 0 || std::strcmp(argv[idx], "-h") == 0) {
      printUsage();
      return false;
    }
    if (std::strcmp(argv[idx], "--seed") == 0 && idx + 1 < argc) {
      opts.seed = static_cast<uint32_t>(std::strtoul(argv[++idx], nullptr, 10));
    } else if (std::strcmp(argv[idx], "--steps") == 0 && idx + 1 < argc) {
      opts.max_steps = static_cast<size_t>(std::strtoull(argv[++idx], nullptr, 10));
    } else if (std::strcmp(argv[idx], "--profile") == 0 && idx + 1 < argc) {
      opts.profile = argv[++idx];
    } else if (std::strcmp(argv[idx], "--map") == 0 && idx + 1 < argc) {
      opts.map = argv[++idx];
    } else if (std::strcmp(argv[idx], "--preset-dir") == 0 && idx + 1 < argc) {
      opts.preset_dir = argv[++idx];
    } else if (std::strcmp(argv[idx], "--save-profile") == 0 && idx + 1 < argc) {
      opts.save_profile = argv[++idx];
    } else if (std::strcmp(argv[idx], "--save-map") == 0 && idx + 1 < argc) {
      opts.save_map = argv[++idx];
    } else if (std::strcmp(argv[idx], "-o") == 0 && idx + 1 < argc) {
      opts.output = argv[++idx];
    } else if (std::strcmp(argv[idx], "--list") == 0) {
      opts.list = true;
    } else if (std::strcmp(argv[idx], "--json") == 0) {
      opts.json_output = true;
    } else if (std::strcmp(argv[idx], "--verbose") == 0) {
      opts.verbose = true;
    } else {
      std::fprintf(stderr, "Warning: ignoring unknown argument '%s'\n", argv[idx]);
    }
  }
  return true;
}

/// @brief True if the argument names a JSON file rather than a preset.
bool looksLikeFile(const std::string& arg) {
  if (arg.size() > 5 && arg.compare(arg.size() - 5, 5, ".json") == 0) return true;
  return arg.find('/') != std::string::npos;
}

/// @brief Merge built-in presets with those from --preset-dir (directory wins).
template <typename T>
void mergePresets(std::map<std::string, T>& into, std::map<std::string, T> from) {
  for (auto& entry : from) {
    into[entry.first] = std::move(entry.second);
  }
}

/// @brief Print the preset names of one kind.
template <typename T>
void printNames(const char* title, const std::map<std::string, T>& presets) {
  std::printf("%s:\n", title);
  for (const auto& entry : presets) {
    std::printf("  %s\n", entry.first.c_str());
  }
}

/// @brief Swap the output extension for ".json".
std::string jsonPathFor(const std::string& output) {
  std::string json_path = output;
  auto dot_pos = json_path.rfind('.');
  if (dot_pos != std::string::npos && json_path.find('/', dot_pos) == std::string::npos) {
    json_path = json_path.substr(0, dot_pos) + ".json";
  } else {
    json_path += ".json";
  }
  return json_path;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions opts;
  if (!parseArgs(argc, argv, opts)) {
    return 0;
  }

  cavewalk::BuiltinPresetProvider builtin;
  std::map<std::string, cavewalk::GenerationProfile> profiles = builtin.profiles();
  std::map<std::string, cavewalk::MapSkeleton> maps = builtin.maps();
  if (!opts.preset_dir.empty()) {
    cavewalk::DirectoryPresetProvider directory(opts.preset_dir);
    mergePresets(profiles, directory.profiles());
    for (const auto& err : directory.errors()) {
      std::fprintf(stderr, "Warning: %s\n", err.c_str());
    }
    mergePresets(maps, directory.maps());
    for (const auto& err : directory.errors()) {
      std::fprintf(stderr, "Warning: %s\n", err.c_str());
    }
  }

  if (opts.list) {
    printNames("Profiles", profiles);
    printNames("Maps", maps);
    return 0;
  }

  // Resolve profile.
  cavewalk::GenerationProfile profile;
  if (looksLikeFile(opts.profile)) {
    cavewalk::ProfileLoadResult loaded = cavewalk::loadProfileFile(opts.profile);
    if (!loaded.success) {
      std::fprintf(stderr, "Error: %s\n", loaded.error_message.c_str());
      return 1;
    }
    profile = loaded.profile;
  } else {
    auto iter = profiles.find(opts.profile);
    if (iter == profiles.end()) {
      std::fprintf(stderr, "Error: unknown profile '%s' (see --list)\n", opts.profile.c_str());
      return 1;
    }
    profile = iter->second;
  }

  // Resolve map skeleton.
  cavewalk::MapSkeleton skeleton;
  if (looksLikeFile(opts.map)) {
    cavewalk::SkeletonLoadResult loaded = cavewalk::loadSkeletonFile(opts.map);
    if (!loaded.success) {
      std::fprintf(stderr, "Error: %s\n", loaded.error_message.c_str());
      return 1;
    }
    skeleton = loaded.skeleton;
  } else {
    auto iter = maps.find(opts.map);
    if (iter == maps.end()) {
      std::fprintf(stderr, "Error: unknown map '%s' (see --list)\n", opts.map.c_str());
      return 1;
    }
    skeleton = iter->second;
  }

  if (!opts.save_profile.empty()) {
    if (!cavewalk::saveProfileFile(profile, opts.save_profile)) {
      std::fprintf(stderr, "Error: failed to write %s\n", opts.save_profile.c_str());
      return 1;
    }
    std::printf("Saved profile: %s\n", opts.save_profile.c_str());
  }
  if (!opts.save_map.empty()) {
    if (!cavewalk::saveSkeletonFile(skeleton, opts.save_map)) {
      std::fprintf(stderr, "Error: failed to write %s\n", opts.save_map.c_str());
      return 1;
    }
    std::printf("Saved map:     %s\n", opts.save_map.c_str());
  }

  cavewalk::GeneratorConfig config;
  config.seed = opts.seed;
  config.max_steps = opts.max_steps;
  config.verbose = opts.verbose;

  std::printf("cavewalk_cli v0.1.0\n");
  std::printf("Profile:    %s\n", profile.name.c_str());
  std::printf("Map:        %s (%zux%zu, %zu waypoints)\n", skeleton.name.c_str(),
              skeleton.width, skeleton.height, skeleton.waypoints.size());
  std::printf("Steps:      %zu\n", config.max_steps);
  std::printf("Seed:       %u%s\n", config.seed, config.seed == 0 ? " (auto)" : "");
  std::printf("\n");

  cavewalk::GenerationResult result =
      cavewalk::Generator::generateMap(config, profile, skeleton);

  if (!result.success) {
    std::fprintf(stderr, "Error: %s\n", result.error_message.c_str());
    std::fprintf(stderr, "Seed used: %u\n", result.seed_used);
    return 1;
  }

  std::printf("Seed used: %u\n", result.seed_used);
  std::printf("Steps:     %zu%s\n", result.steps_taken,
              result.finished ? "" : " (budget exhausted)");
  std::printf("Platforms: %zu\n", result.platforms_placed);
  std::printf("Skips:     %zu of %zu candidates\n", result.skips.accepted.size(),
              result.skips.candidates);
  std::printf("Empty:     %zu cells\n", result.grid.count(cavewalk::CellType::Empty));

  if (cavewalk::writeAsciiFile(result.grid, opts.output)) {
    std::printf("\nOutput:    %s\n", opts.output.c_str());
  } else {
    std::fprintf(stderr, "Error: failed to write %s\n", opts.output.c_str());
    return 1;
  }

  if (opts.json_output) {
    std::string json_path = jsonPathFor(opts.output);
    std::ofstream json_file(json_path);
    if (json_file.is_open()) {
      json_file << cavewalk::buildReportJson(result, profile, skeleton);
      json_file.close();
      std::printf("JSON:      %s\n", json_path.c_str());
    } else {
      std::fprintf(stderr, "Warning: failed to write %s\n", json_path.c_str());
    }
  }

  return 0;
}
