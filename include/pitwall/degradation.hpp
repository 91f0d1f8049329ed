#pragma once
#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include <pitwall/compound.hpp>
#include <pitwall/lap_record.hpp>
#include <pitwall/logging.hpp>
#include <pitwall/track.hpp>

namespace pitwall {

struct ModelConfig {
  double window_delta_sec = 1.2;          // lap-time loss that closes the useful window
  std::size_t min_track_type_records = 12;
  std::size_t min_fit_records = 6;
  double default_slope_sec_per_km = 0.03;
  double wet_experience_scale_km = 2000.0;
  double max_wet_reduction = 0.2;
  double fresh_tyre_life_laps = 2.0;
  double window_fallback_quantile = 0.75; // window when slope is ~0
  double window_cap_quantile = 0.90;      // window never exceeds observed support
};

struct CompoundModel {
  Compound compound = Compound::Medium;
  double slope_sec_per_km = 0.0;
  double intercept_sec = 0.0;
  double window_km = 0.0;
  int window_laps = 1;
  double fresh_lap_time_sec = 0.0;
  std::size_t sample_size = 0;
};

// Ordered SOFT..WET; compounds without data are absent.
using CompoundModels = std::map<Compound, CompoundModel>;

struct FitTarget {
  std::string driver;
  std::string team;               // canonical
  TrackType track_type = kDefaultTrackType;
  double track_length_km = kDefaultTrackLengthKm;
  double wet_experience_km = 0.0;
};

// One tier of the scoping fallback chain.
struct ScopeTier {
  std::string name;
  std::function<bool(const LapRecord&)> matches;
};

// driver+team, then team, then everything.
std::vector<ScopeTier> default_scope_tiers(const std::string& driver, const std::string& team);

// Records of the first tier that matches anything; empty only for empty input.
std::vector<LapRecord> scope_history(const LapHistory& history,
                                     const std::vector<ScopeTier>& tiers,
                                     std::string* chosen_tier = nullptr);

// Sum of track length over the driver/team's wet laps in the season on tracks
// of the given type. 0.0 when there are none.
double compute_wet_experience_km(const LapHistory& history,
                                 int season_year,
                                 const std::string& driver,
                                 const std::string& team,
                                 TrackType track_type);

// Fit one degradation model per compound present in the scoped history.
CompoundModels build_compound_models(const LapHistory& history,
                                     const FitTarget& target,
                                     const ModelConfig& cfg = {},
                                     LogSink* sink = nullptr);

} // namespace pitwall
