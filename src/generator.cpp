// Implementation of the level generator and its post-processing passes.

#include "generator.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string_view>
#include <utility>

#include "core/json_helpers.h"
#include "core/rng_util.h"
#include "generator_internal.h"
#include "map/grid_io.h"
#include "walker/kernel.h"

namespace cavewalk {

namespace {

/// @brief Circularity of the initial outer kernel.
constexpr float kInitialOuterCircularity = 0.1f;

int clampCoord(long value, size_t extent) {
  long upper = static_cast<long>(extent) - 1;
  return static_cast<int>(std::clamp(value, 0L, upper));
}

}  // namespace

// ---------------------------------------------------------------------------
// Set-up and post-processing helpers
// ---------------------------------------------------------------------------

std::vector<Position> buildWaypoints(const MapSkeleton& skeleton,
                                     const GenerationProfile& profile,
                                     WeightedSampler& sampler) {
  std::vector<Position> result;
  if (skeleton.waypoints.empty()) return result;

  const float shift = profile.subwaypoint_max_shift_dist;
  result.push_back(skeleton.waypoints.front());
  for (size_t idx = 1; idx < skeleton.waypoints.size(); ++idx) {
    const Position& from = skeleton.waypoints[idx - 1];
    const Position& to = skeleton.waypoints[idx];
    float dist = from.distance(to);
    size_t segments =
        std::max<size_t>(1, static_cast<size_t>(std::ceil(dist / profile.max_subwaypoint_dist)));

    for (size_t seg = 1; seg < segments; ++seg) {
      float progress = static_cast<float>(seg) / static_cast<float>(segments);
      float x = static_cast<float>(from.x) + static_cast<float>(to.x - from.x) * progress;
      float y = static_cast<float>(from.y) + static_cast<float>(to.y - from.y) * progress;
      x += sampler.uniformFloat(-shift, shift);
      y += sampler.uniformFloat(-shift, shift);
      result.emplace_back(clampCoord(std::lround(x), skeleton.width),
                          clampCoord(std::lround(y), skeleton.height));
    }
    result.push_back(to);
  }
  return result;
}

size_t fixEdgeBugs(Grid& grid) {
  size_t fixed = 0;
  const int width = static_cast<int>(grid.width());
  const int height = static_cast<int>(grid.height());
  for (int y = 0; y < height; ++y) {
    for (int x = 0; x < width; ++x) {
      if (grid.at(x, y) != CellType::Empty) continue;
      bool touches_hookable = false;
      for (int dy = -1; dy <= 1 && !touches_hookable; ++dy) {
        for (int dx = -1; dx <= 1; ++dx) {
          if ((dx != 0 || dy != 0) && grid.inBounds(x + dx, y + dy) &&
              grid.at(x + dx, y + dy) == CellType::Hookable) {
            touches_hookable = true;
            break;
          }
        }
      }
      if (touches_hookable) {
        grid.at(x, y) = CellType::Freeze;
        ++fixed;
      }
    }
  }
  return fixed;
}

void carveRoom(Grid& grid, const Position& center, size_t margin, CellType marker) {
  const int room = static_cast<int>(margin);
  const int half_platform = room - 2;

  grid.setArea(center - Position(room, room), center + Position(room, room), CellType::Empty,
               true);
  grid.setArea(Position(center.x - half_platform, center.y),
               Position(center.x + half_platform, center.y), CellType::Hookable, true);
  if (marker == CellType::Start) {
    grid.setArea(Position(center.x - half_platform, center.y - 1),
                 Position(center.x + half_platform, center.y - 1), CellType::Spawn, true);
  }
  grid.setAreaBorder(center - Position(room + 1, room + 1),
                     center + Position(room + 1, room + 1), marker, true);
}

// ---------------------------------------------------------------------------
// Generator
// ---------------------------------------------------------------------------

Generator::Generator(const GenerationProfile& profile, const MapSkeleton& skeleton,
                     uint32_t seed)
    : sampler_(seed) {
  ProfileValidation profile_check = validateProfile(profile);
  if (!profile_check.valid) {
    error_ = GenerationError::make(ErrorKind::InvalidConfig, 0, profile_check.parameter,
                                   profile_check.message);
    return;
  }
  SkeletonValidation skeleton_check = validateSkeleton(skeleton);
  if (!skeleton_check.valid) {
    error_ = GenerationError::make(ErrorKind::InvalidConfig, 0, "map", skeleton_check.message);
    return;
  }

  grid_ = Grid(skeleton.width, skeleton.height, CellType::Hookable, skeleton.spawn);
  std::vector<Position> waypoints = buildWaypoints(skeleton, profile, sampler_);
  Kernel inner(profile.inner_size_probs.maxValue(), 0.0f);
  walker_.emplace(skeleton.spawn, inner, profile.outer_margin_probs.maxValue(),
                  kInitialOuterCircularity, std::move(waypoints), skeleton.width,
                  skeleton.height);
}

bool Generator::isFinished() const {
  return walker_ && walker_->isFinished();
}

const GenerationError& Generator::step(const GenerationProfile& profile) {
  if (!ok() || !walker_ || walker_->isFinished()) return error_;
  error_ = walker_->step(grid_, sampler_, profile);
  return error_;
}

bool Generator::postProcess(const GenerationProfile& profile) {
  if (!ok() || !walker_ || post_processed_) return false;
  post_processed_ = true;

  if (profile.enable_skips) {
    skip_report_ = generateSkips(grid_, walker_->history(), profile);
  }
  edge_fixes_ = fixEdgeBugs(grid_);
  carveRoom(grid_, grid_.spawn(), profile.room_margin, CellType::Start);
  carveRoom(grid_, walker_->position(), profile.room_margin, CellType::Finish);
  return true;
}

GenerationResult Generator::generateMap(const GeneratorConfig& config,
                                        const GenerationProfile& profile,
                                        const MapSkeleton& skeleton) {
  GenerationResult result;
  uint32_t seed = config.seed;
  if (seed == 0) {
    seed = rng::generateRandomSeed();
  }
  result.seed_used = seed;

  Generator generator(profile, skeleton, seed);
  while (generator.ok() && !generator.isFinished() &&
         generator.stepsTaken() < config.max_steps) {
    generator.step(profile);
  }

  result.steps_taken = generator.stepsTaken();
  result.finished = generator.isFinished();
  if (!generator.ok()) {
    result.success = false;
    result.error = generator.error();
    result.error_message = generator.error().describe();
    result.grid = generator.grid();
    if (config.verbose) {
      std::fprintf(stderr, "[Generator] seed=%u failed: %s\n", seed,
                   result.error_message.c_str());
    }
    return result;
  }

  if (!result.finished) {
    std::fprintf(stderr,
                 "[Generator] WARNING: step budget %zu exhausted before the last waypoint\n",
                 config.max_steps);
  }

  generator.postProcess(profile);
  result.success = true;
  result.grid = generator.grid();
  result.finish_position = generator.walker()->position();
  result.skips = generator.skipReport();
  result.platforms_placed = generator.walker()->platformsPlaced();
  result.edge_fixes = generator.edgeFixes();

  if (config.verbose) {
    std::fprintf(stderr, "[Generator] seed=%u steps=%zu finished=%s platforms=%zu edge_fixes=%zu\n",
                 seed, result.steps_taken, result.finished ? "yes" : "no",
                 result.platforms_placed, result.edge_fixes);
    if (profile.enable_skips) {
      std::fprintf(stderr, "[Skips] candidates=%zu accepted=%zu rejected=%zu\n",
                   result.skips.candidates, result.skips.accepted.size(),
                   result.skips.rejected());
    }
  }
  return result;
}

std::string buildReportJson(const GenerationResult& result, const GenerationProfile& profile,
                            const MapSkeleton& skeleton) {
  JsonWriter writer;
  writer.beginObject();

  writer.field("profile", profile.name);
  writer.field("map", skeleton.name);
  writer.field("seed", result.seed_used);
  writer.field("success", result.success);
  if (!result.success) {
    writer.field("error", std::string(errorKindToString(result.error.kind)));
    writer.field("error_message", result.error_message);
  }
  writer.field("width", result.grid.width());
  writer.field("height", result.grid.height());
  writer.key("spawn");
  writer.beginObject();
  writer.field("x", result.grid.spawn().x);
  writer.field("y", result.grid.spawn().y);
  writer.endObject();
  writer.field("steps", result.steps_taken);
  writer.field("finished", result.finished);
  writer.field("platforms", result.platforms_placed);
  writer.field("edge_fixes", result.edge_fixes);

  writer.key("cells");
  writer.beginObject();
  for (CellType type : {CellType::Empty, CellType::Hookable, CellType::Freeze, CellType::Spawn,
                        CellType::Start, CellType::Finish}) {
    writer.field(cellTypeToString(type), result.grid.count(type));
  }
  writer.endObject();

  writer.key("skips");
  writer.beginObject();
  writer.field("candidates", result.skips.candidates);
  writer.field("rejected", result.skips.rejected());
  writer.key("accepted");
  writer.beginArray();
  for (const Skip& skip : result.skips.accepted) {
    writer.beginObject();
    writer.field("x0", skip.start.x);
    writer.field("y0", skip.start.y);
    writer.field("x1", skip.end.x);
    writer.field("y1", skip.end.y);
    writer.field("length", skip.length);
    writer.field("direction", shiftDirectionToString(skip.direction));
    writer.endObject();
  }
  writer.endArray();
  writer.endObject();

  writer.key("rows");
  writer.beginArray();
  std::string ascii = gridToAscii(result.grid);
  size_t start = 0;
  while (start < ascii.size()) {
    size_t end = ascii.find('\n', start);
    if (end == std::string::npos) end = ascii.size();
    writer.value(std::string_view(ascii).substr(start, end - start));
    start = end + 1;
  }
  writer.endArray();

  writer.endObject();
  return writer.toPrettyString();
}

}  // namespace cavewalk
