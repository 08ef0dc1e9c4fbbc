// Profile and map skeleton JSON reading and writing.

#include "config/profile_io.h"

#include <cmath>
#include <fstream>
#include <optional>
#include <sstream>
#include <utility>
#include <vector>

#include "core/json_helpers.h"
#include "core/json_parser.h"

namespace cavewalk {

namespace {

/// @brief Reads typed fields out of a JSON object, keeping the first error.
///
/// Every read is a no-op once an error has been recorded, so callers can read
/// all fields unconditionally and check ok() once at the end.
class FieldReader {
 public:
  FieldReader(const JsonValue& object, const std::string& source)
      : object_(object), source_(source) {}

  bool ok() const { return error_.empty(); }
  const std::string& error() const { return error_; }

  void readString(const char* key, std::string& out) {
    const JsonValue* val = lookup(key);
    if (!val) return;
    if (val->type != JsonValue::String) return fail(key, "expected a string");
    out = val->string_val;
  }

  void readBool(const char* key, bool& out) {
    const JsonValue* val = lookup(key);
    if (!val) return;
    if (val->type != JsonValue::Bool) return fail(key, "expected true or false");
    out = val->bool_val;
  }

  void readFloat(const char* key, float& out) {
    const JsonValue* val = lookup(key);
    if (!val) return;
    if (!val->isNumber()) return fail(key, "expected a number");
    out = val->asFloat();
  }

  void readSize(const char* key, size_t& out) {
    const JsonValue* val = lookup(key);
    if (!val) return;
    std::optional<size_t> size = toSize(*val);
    if (!size) return fail(key, "expected a non-negative integer");
    out = *size;
  }

  void readBounds(const char* key, SizeBounds& out) {
    const JsonValue* val = lookup(key);
    if (!val) return;
    if (!val->isArray() || val->array_val.size() != 2) {
      return fail(key, "expected [min, max]");
    }
    std::optional<size_t> min_val = toSize(val->array_val[0]);
    std::optional<size_t> max_val = toSize(val->array_val[1]);
    if (!min_val || !max_val) return fail(key, "bounds must be non-negative integers");
    out = SizeBounds(*min_val, *max_val);
  }

  void readWeights(const char* key, std::vector<float>& out) {
    const JsonValue* val = lookup(key);
    if (!val) return;
    const JsonValue* weights = val->find("weights");
    if (!weights) return fail(key, "expected {\"weights\": [...]}");
    std::vector<float> parsed;
    if (!toFloats(*weights, parsed)) return fail(key, "weights must be an array of numbers");
    out = std::move(parsed);
  }

  void readSizeTable(const char* key, WeightedTable<size_t>& out) {
    const JsonValue* val = lookup(key);
    if (!val) return;
    const JsonValue* values = val->find("values");
    const JsonValue* weights = val->find("weights");
    if (!values || !weights) return fail(key, "expected {\"values\": [...], \"weights\": [...]}");
    WeightedTable<size_t> table;
    if (!values->isArray()) return fail(key, "values must be an array");
    for (const JsonValue& elem : values->array_val) {
      std::optional<size_t> size = toSize(elem);
      if (!size) return fail(key, "values must be non-negative integers");
      table.values.push_back(*size);
    }
    if (!toFloats(*weights, table.weights)) {
      return fail(key, "weights must be an array of numbers");
    }
    out = std::move(table);
  }

  void readFloatTable(const char* key, WeightedTable<float>& out) {
    const JsonValue* val = lookup(key);
    if (!val) return;
    const JsonValue* values = val->find("values");
    const JsonValue* weights = val->find("weights");
    if (!values || !weights) return fail(key, "expected {\"values\": [...], \"weights\": [...]}");
    WeightedTable<float> table;
    if (!toFloats(*values, table.values)) return fail(key, "values must be an array of numbers");
    if (!toFloats(*weights, table.weights)) {
      return fail(key, "weights must be an array of numbers");
    }
    out = std::move(table);
  }

  void readPosition(const char* key, Position& out) {
    const JsonValue* val = lookup(key);
    if (!val) return;
    std::optional<Position> pos = toPosition(*val);
    if (!pos) return fail(key, "expected {\"x\": int, \"y\": int}");
    out = *pos;
  }

  void readPositions(const char* key, std::vector<Position>& out) {
    const JsonValue* val = lookup(key);
    if (!val) return;
    if (!val->isArray()) return fail(key, "expected an array of {\"x\", \"y\"} points");
    std::vector<Position> points;
    for (size_t idx = 0; idx < val->array_val.size(); ++idx) {
      std::optional<Position> pos = toPosition(val->array_val[idx]);
      if (!pos) {
        return fail(key, "entry " + std::to_string(idx) + " is not a {\"x\", \"y\"} point");
      }
      points.push_back(*pos);
    }
    out = std::move(points);
  }

 private:
  const JsonValue* lookup(const char* key) const {
    if (!ok()) return nullptr;
    return object_.find(key);
  }

  void fail(const char* key, const std::string& problem) {
    if (ok()) error_ = source_ + ": " + key + ": " + problem;
  }

  static std::optional<size_t> toSize(const JsonValue& val) {
    if (!val.isNumber() || val.number_val < 0.0 ||
        std::floor(val.number_val) != val.number_val) {
      return std::nullopt;
    }
    return val.asSize();
  }

  static bool toFloats(const JsonValue& val, std::vector<float>& out) {
    if (!val.isArray()) return false;
    std::vector<float> parsed;
    for (const JsonValue& elem : val.array_val) {
      if (!elem.isNumber()) return false;
      parsed.push_back(elem.asFloat());
    }
    out = std::move(parsed);
    return true;
  }

  static std::optional<Position> toPosition(const JsonValue& val) {
    const JsonValue* x_val = val.find("x");
    const JsonValue* y_val = val.find("y");
    if (!x_val || !y_val || !x_val->isNumber() || !y_val->isNumber()) return std::nullopt;
    return Position(x_val->asInt(), y_val->asInt());
  }

  const JsonValue& object_;
  const std::string& source_;
  std::string error_;
};

/// @brief Parse text and require an object at the top level.
bool parseTopObject(std::string_view json, const std::string& source, JsonValue& out,
                    std::string& error) {
  JsonParseResult parsed = parseJson(json);
  if (!parsed.success) {
    error = source + ": offset " + std::to_string(parsed.error_offset) + ": " +
            parsed.error_message;
    return false;
  }
  if (!parsed.value.isObject()) {
    error = source + ": top-level value must be an object";
    return false;
  }
  out = std::move(parsed.value);
  return true;
}

bool readFile(const std::string& path, std::string& out) {
  std::ifstream file(path);
  if (!file.is_open()) return false;
  std::ostringstream oss;
  oss << file.rdbuf();
  out = oss.str();
  return true;
}

bool writeFile(const std::string& path, const std::string& content) {
  std::ofstream file(path);
  if (!file.is_open()) return false;
  file << content << '\n';
  return static_cast<bool>(file);
}

template <typename T>
void writeTable(JsonWriter& writer, const char* name, const WeightedTable<T>& table) {
  writer.key(name);
  writer.beginObject();
  writer.key("values");
  writer.beginArray();
  for (const T& val : table.values) writer.value(val);
  writer.endArray();
  writer.key("weights");
  writer.beginArray();
  for (float weight : table.weights) writer.value(static_cast<double>(weight));
  writer.endArray();
  writer.endObject();
}

void writeBounds(JsonWriter& writer, const char* name, const SizeBounds& bounds) {
  writer.key(name);
  writer.beginArray();
  writer.value(bounds.first);
  writer.value(bounds.second);
  writer.endArray();
}

void writePosition(JsonWriter& writer, const Position& pos) {
  writer.beginObject();
  writer.field("x", pos.x);
  writer.field("y", pos.y);
  writer.endObject();
}

}  // namespace

// ---------------------------------------------------------------------------
// Profiles
// ---------------------------------------------------------------------------

ProfileLoadResult profileFromJson(std::string_view json, const std::string& source) {
  ProfileLoadResult result;
  JsonValue root;
  if (!parseTopObject(json, source, root, result.error_message)) return result;

  GenerationProfile& prof = result.profile;
  FieldReader reader(root, source);
  reader.readString("name", prof.name);
  reader.readString("description", prof.description);
  reader.readString("version", prof.version);

  reader.readFloat("inner_rad_mut_prob", prof.inner_rad_mut_prob);
  reader.readFloat("inner_size_mut_prob", prof.inner_size_mut_prob);
  reader.readFloat("outer_rad_mut_prob", prof.outer_rad_mut_prob);
  reader.readFloat("outer_size_mut_prob", prof.outer_size_mut_prob);
  reader.readSizeTable("inner_size_probs", prof.inner_size_probs);
  reader.readSizeTable("outer_margin_probs", prof.outer_margin_probs);
  reader.readFloatTable("circ_probs", prof.circ_probs);
  reader.readFloat("edge_carve_prob", prof.edge_carve_prob);

  reader.readWeights("shift_weights", prof.shift_weights);
  reader.readFloat("momentum_prob", prof.momentum_prob);
  reader.readSize("waypoint_reached_dist", prof.waypoint_reached_dist);
  reader.readFloat("max_subwaypoint_dist", prof.max_subwaypoint_dist);
  reader.readFloat("subwaypoint_max_shift_dist", prof.subwaypoint_max_shift_dist);

  reader.readBool("enable_platforms", prof.enable_platforms);
  reader.readSize("plat_min_distance", prof.plat_min_distance);
  reader.readBounds("plat_width_bounds", prof.plat_width_bounds);
  reader.readBounds("plat_height_bounds", prof.plat_height_bounds);
  reader.readSize("plat_min_empty_height", prof.plat_min_empty_height);
  reader.readBool("plat_soft_overhang", prof.plat_soft_overhang);

  reader.readBool("enable_skips", prof.enable_skips);
  reader.readBounds("skip_length_bounds", prof.skip_length_bounds);
  reader.readSize("skip_min_spacing_sqr", prof.skip_min_spacing_sqr);
  reader.readSize("max_level_skip", prof.max_level_skip);
  reader.readFloat("max_skip_fraction", prof.max_skip_fraction);

  reader.readBool("enable_pulse", prof.enable_pulse);
  reader.readSize("pulse_straight_delay", prof.pulse_straight_delay);
  reader.readSize("pulse_corner_delay", prof.pulse_corner_delay);
  reader.readSize("pulse_max_kernel_size", prof.pulse_max_kernel_size);
  reader.readSize("fade_steps", prof.fade_steps);
  reader.readSize("fade_max_size", prof.fade_max_size);
  reader.readSize("fade_min_size", prof.fade_min_size);

  reader.readFloat("pos_lock_max_dist", prof.pos_lock_max_dist);
  reader.readSize("pos_lock_max_delay", prof.pos_lock_max_delay);
  reader.readSize("lock_kernel_size", prof.lock_kernel_size);
  reader.readSize("room_margin", prof.room_margin);

  if (!reader.ok()) {
    result.error_message = reader.error();
    return result;
  }
  result.success = true;
  return result;
}

std::string profileToJson(const GenerationProfile& profile) {
  JsonWriter writer;
  writer.beginObject();
  writer.field("name", profile.name);
  writer.field("description", profile.description);
  writer.field("version", profile.version);

  writer.field("inner_rad_mut_prob", profile.inner_rad_mut_prob);
  writer.field("inner_size_mut_prob", profile.inner_size_mut_prob);
  writer.field("outer_rad_mut_prob", profile.outer_rad_mut_prob);
  writer.field("outer_size_mut_prob", profile.outer_size_mut_prob);
  writeTable(writer, "inner_size_probs", profile.inner_size_probs);
  writeTable(writer, "outer_margin_probs", profile.outer_margin_probs);
  writeTable(writer, "circ_probs", profile.circ_probs);
  writer.field("edge_carve_prob", profile.edge_carve_prob);

  writer.key("shift_weights");
  writer.beginObject();
  writer.key("weights");
  writer.beginArray();
  for (float weight : profile.shift_weights) writer.value(static_cast<double>(weight));
  writer.endArray();
  writer.endObject();
  writer.field("momentum_prob", profile.momentum_prob);
  writer.field("waypoint_reached_dist", profile.waypoint_reached_dist);
  writer.field("max_subwaypoint_dist", profile.max_subwaypoint_dist);
  writer.field("subwaypoint_max_shift_dist", profile.subwaypoint_max_shift_dist);

  writer.field("enable_platforms", profile.enable_platforms);
  writer.field("plat_min_distance", profile.plat_min_distance);
  writeBounds(writer, "plat_width_bounds", profile.plat_width_bounds);
  writeBounds(writer, "plat_height_bounds", profile.plat_height_bounds);
  writer.field("plat_min_empty_height", profile.plat_min_empty_height);
  writer.field("plat_soft_overhang", profile.plat_soft_overhang);

  writer.field("enable_skips", profile.enable_skips);
  writeBounds(writer, "skip_length_bounds", profile.skip_length_bounds);
  writer.field("skip_min_spacing_sqr", profile.skip_min_spacing_sqr);
  writer.field("max_level_skip", profile.max_level_skip);
  writer.field("max_skip_fraction", profile.max_skip_fraction);

  writer.field("enable_pulse", profile.enable_pulse);
  writer.field("pulse_straight_delay", profile.pulse_straight_delay);
  writer.field("pulse_corner_delay", profile.pulse_corner_delay);
  writer.field("pulse_max_kernel_size", profile.pulse_max_kernel_size);
  writer.field("fade_steps", profile.fade_steps);
  writer.field("fade_max_size", profile.fade_max_size);
  writer.field("fade_min_size", profile.fade_min_size);

  writer.field("pos_lock_max_dist", profile.pos_lock_max_dist);
  writer.field("pos_lock_max_delay", profile.pos_lock_max_delay);
  writer.field("lock_kernel_size", profile.lock_kernel_size);
  writer.field("room_margin", profile.room_margin);
  writer.endObject();
  return writer.toPrettyString();
}

// ---------------------------------------------------------------------------
// Map skeletons
// ---------------------------------------------------------------------------

SkeletonLoadResult skeletonFromJson(std::string_view json, const std::string& source) {
  SkeletonLoadResult result;
  JsonValue root;
  if (!parseTopObject(json, source, root, result.error_message)) return result;

  MapSkeleton& skel = result.skeleton;
  FieldReader reader(root, source);
  reader.readString("name", skel.name);
  reader.readSize("width", skel.width);
  reader.readSize("height", skel.height);
  reader.readPosition("spawn", skel.spawn);
  reader.readPositions("waypoints", skel.waypoints);

  if (!reader.ok()) {
    result.error_message = reader.error();
    return result;
  }
  result.success = true;
  return result;
}

std::string skeletonToJson(const MapSkeleton& skeleton) {
  JsonWriter writer;
  writer.beginObject();
  writer.field("name", skeleton.name);
  writer.field("width", skeleton.width);
  writer.field("height", skeleton.height);
  writer.key("spawn");
  writePosition(writer, skeleton.spawn);
  writer.key("waypoints");
  writer.beginArray();
  for (const Position& point : skeleton.waypoints) writePosition(writer, point);
  writer.endArray();
  writer.endObject();
  return writer.toPrettyString();
}

// ---------------------------------------------------------------------------
// Files
// ---------------------------------------------------------------------------

ProfileLoadResult loadProfileFile(const std::string& path) {
  std::string text;
  if (!readFile(path, text)) {
    ProfileLoadResult result;
    result.error_message = path + ": cannot open file";
    return result;
  }
  return profileFromJson(text, path);
}

SkeletonLoadResult loadSkeletonFile(const std::string& path) {
  std::string text;
  if (!readFile(path, text)) {
    SkeletonLoadResult result;
    result.error_message = path + ": cannot open file";
    return result;
  }
  return skeletonFromJson(text, path);
}

bool saveProfileFile(const GenerationProfile& profile, const std::string& path) {
  return writeFile(path, profileToJson(profile));
}

bool saveSkeletonFile(const MapSkeleton& skeleton, const std::string& path) {
  return writeFile(path, skeletonToJson(skeleton));
}

}  // namespace cavewalk
