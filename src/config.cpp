#include <pitwall/config.hpp>
#include <pitwall/errors.hpp>
#include <sstream>
#include <string>

#include <yaml-cpp/yaml.h>

namespace pitwall {

namespace {

template <typename T>
void optional_scalar(const YAML::Node& section, const char* key, T& out, const std::string& origin) {
  if (!section || section.IsNull()) return;
  if (!section.IsMap()) {
    throw ConfigError(PITWALL_LOC("expected a mapping around key '" + std::string(key) + "' in " + origin));
  }
  const YAML::Node value = section[key];
  if (!value) return;
  try {
    out = value.as<T>();
  } catch (const YAML::BadConversion& ex) {
    std::ostringstream oss;
    oss << "Invalid type for key '" << key << "' in " << origin << ": " << ex.what();
    throw ConfigError(PITWALL_LOC(oss.str()));
  }
}

void require(bool ok, const std::string& what) {
  if (!ok) throw ConfigError(PITWALL_LOC("invalid planner config: " + what));
}

PlannerConfig from_node(const YAML::Node& root, const std::string& origin) {
  PlannerConfig cfg;
  if (!root || root.IsNull()) return cfg;
  if (!root.IsMap()) {
    throw ConfigError(PITWALL_LOC("planner config root must be a mapping in " + origin));
  }

  const YAML::Node planner = root["planner"];
  optional_scalar(planner, "pit_loss_sec", cfg.pit_loss_sec, origin);
  optional_scalar(planner, "wet_share_threshold", cfg.wet_share_threshold, origin);

  const YAML::Node model = root["model"];
  optional_scalar(model, "window_delta_sec", cfg.model.window_delta_sec, origin);
  optional_scalar(model, "min_track_type_records", cfg.model.min_track_type_records, origin);
  optional_scalar(model, "min_fit_records", cfg.model.min_fit_records, origin);
  optional_scalar(model, "default_slope_sec_per_km", cfg.model.default_slope_sec_per_km, origin);
  optional_scalar(model, "wet_experience_scale_km", cfg.model.wet_experience_scale_km, origin);
  optional_scalar(model, "max_wet_reduction", cfg.model.max_wet_reduction, origin);
  optional_scalar(model, "fresh_tyre_life_laps", cfg.model.fresh_tyre_life_laps, origin);

  const YAML::Node search = root["search"];
  optional_scalar(search, "max_stops", cfg.search.max_stops, origin);
  optional_scalar(search, "top_k", cfg.search.top_k, origin);
  optional_scalar(search, "window_margin_laps", cfg.search.window_margin_laps, origin);
  optional_scalar(search, "min_stint_laps", cfg.search.min_stint_laps, origin);
  optional_scalar(search, "length_step_laps", cfg.search.length_step_laps, origin);

  optional_scalar(root["overstay"], "max_extra_laps", cfg.overstay_laps, origin);

  validate_planner_config(cfg);
  return cfg;
}

} // namespace

void validate_planner_config(const PlannerConfig& cfg) {
  require(cfg.pit_loss_sec >= 0.0, "planner.pit_loss_sec must be >= 0");
  require(cfg.wet_share_threshold >= 0.0 && cfg.wet_share_threshold <= 1.0,
          "planner.wet_share_threshold must be in [0, 1]");
  require(cfg.model.window_delta_sec > 0.0, "model.window_delta_sec must be > 0");
  require(cfg.model.default_slope_sec_per_km >= 0.0, "model.default_slope_sec_per_km must be >= 0");
  require(cfg.model.wet_experience_scale_km > 0.0, "model.wet_experience_scale_km must be > 0");
  require(cfg.model.max_wet_reduction >= 0.0 && cfg.model.max_wet_reduction <= 1.0,
          "model.max_wet_reduction must be in [0, 1]");
  require(cfg.search.max_stops >= 1, "search.max_stops must be >= 1");
  require(cfg.search.top_k >= 1, "search.top_k must be >= 1");
  require(cfg.search.window_margin_laps >= 0, "search.window_margin_laps must be >= 0");
  require(cfg.search.min_stint_laps >= 1, "search.min_stint_laps must be >= 1");
  require(cfg.search.length_step_laps >= 1, "search.length_step_laps must be >= 1");
  require(cfg.overstay_laps >= 1, "overstay.max_extra_laps must be >= 1");
}

PlannerConfig parse_planner_config(const std::string& yaml_text, const std::string& origin) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception& ex) {
    throw ConfigError(PITWALL_LOC("failed to parse " + origin + ": " + ex.what()));
  }
  return from_node(root, origin);
}

PlannerConfig load_planner_config(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    throw ConfigError(PITWALL_LOC("config file not found: " + path.string()));
  }
  YAML::Node root;
  try {
    root = YAML::LoadFile(path.string());
  } catch (const YAML::Exception& ex) {
    throw ConfigError(PITWALL_LOC("failed to parse " + path.string() + ": " + ex.what()));
  }
  return from_node(root, path.string());
}

} // namespace pitwall
