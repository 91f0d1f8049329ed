#pragma once
#include <filesystem>
#include <string>
#include <pitwall/degradation.hpp>
#include <pitwall/overstay.hpp>
#include <pitwall/strategy.hpp>

namespace pitwall {

struct PlannerConfig {
  double pit_loss_sec = 21.0;
  double wet_share_threshold = 0.25;   // auto condition: wet when share >= threshold
  ModelConfig model{};
  SearchConfig search{};
  int overstay_laps = kDefaultOverstayLaps;
};

// Parse a YAML document; every key is optional and falls back to the default.
//
//   planner:  { pit_loss_sec, wet_share_threshold }
//   model:    { window_delta_sec, min_track_type_records, min_fit_records,
//               default_slope_sec_per_km, wet_experience_scale_km,
//               max_wet_reduction, fresh_tyre_life_laps }
//   search:   { max_stops, top_k, window_margin_laps, min_stint_laps,
//               length_step_laps }
//   overstay: { max_extra_laps }
//
// Throws ConfigError on malformed YAML, wrong value types or values that fail
// validate_planner_config.
PlannerConfig parse_planner_config(const std::string& yaml_text,
                                   const std::string& origin = "<string>");

// Throws ConfigError when the file is missing or invalid.
PlannerConfig load_planner_config(const std::filesystem::path& path);

// Throws ConfigError describing the first out-of-range value.
void validate_planner_config(const PlannerConfig& cfg);

} // namespace pitwall
