#include <pitwall/degradation.hpp>
#include <pitwall/weighted_stats.hpp>
#include <algorithm>
#include <cmath>
#include <iterator>
#include <sstream>
#include <tuple>

namespace pitwall {

namespace {

struct DeltaLap {
  const LapRecord* rec = nullptr;
  double lap_delta = 0.0;
};

using StintKey = std::tuple<int, std::string, std::string, std::string, int, int>;

StintKey stint_key(const LapRecord& r) {
  return {r.year, r.event_name, r.driver, r.team, r.stint, static_cast<int>(r.compound)};
}

// lap_delta = lap time minus the fastest lap of the same stint.
std::vector<DeltaLap> apply_lap_delta(const std::vector<LapRecord>& scoped) {
  std::map<StintKey, double> baseline;
  for (const auto& r : scoped) {
    auto [it, inserted] = baseline.emplace(stint_key(r), r.lap_time_s);
    if (!inserted) it->second = std::min(it->second, r.lap_time_s);
  }

  std::vector<DeltaLap> out;
  out.reserve(scoped.size());
  for (const auto& r : scoped) {
    out.push_back(DeltaLap{&r, r.lap_time_s - baseline.at(stint_key(r))});
  }
  return out;
}

std::vector<double> tyre_life_km_of(const std::vector<DeltaLap>& laps) {
  std::vector<double> v;
  v.reserve(laps.size());
  for (const auto& l : laps) v.push_back(l.rec->tyre_life_km);
  return v;
}

double fresh_lap_time(const std::vector<DeltaLap>& laps, double fresh_tyre_life_laps) {
  std::vector<double> times, weights;
  for (const auto& l : laps) {
    if (l.rec->tyre_life_laps <= fresh_tyre_life_laps) {
      times.push_back(l.rec->lap_time_s);
      weights.push_back(l.rec->data_weight);
    }
  }
  if (times.empty()) {
    for (const auto& l : laps) {
      times.push_back(l.rec->lap_time_s);
      weights.push_back(l.rec->data_weight);
    }
  }
  return weighted_median(times, weights).value_or(0.0);
}

CompoundModel fit_compound(Compound compound,
                           std::vector<DeltaLap> laps,
                           const FitTarget& target,
                           const ModelConfig& cfg) {
  std::vector<DeltaLap> same_type;
  for (const auto& l : laps) {
    if (l.rec->track_type == target.track_type) same_type.push_back(l);
  }
  if (same_type.size() >= cfg.min_track_type_records) laps = std::move(same_type);

  const std::vector<double> x = tyre_life_km_of(laps);
  std::vector<double> y, w;
  y.reserve(laps.size());
  w.reserve(laps.size());
  for (const auto& l : laps) {
    y.push_back(l.lap_delta);
    w.push_back(l.rec->data_weight);
  }

  LineFit fit{cfg.default_slope_sec_per_km, 0.0};
  if (laps.size() >= cfg.min_fit_records) {
    if (auto f = weighted_linear_fit(x, y, w)) fit = *f;
  }

  CompoundModel m;
  m.compound = compound;
  m.slope_sec_per_km = std::max(0.0, fit.slope);
  m.intercept_sec = std::max(0.0, fit.intercept);

  if (is_wet_compound(compound) && target.wet_experience_km > 0.0) {
    const double reduction = std::min(cfg.max_wet_reduction,
                                      target.wet_experience_km / cfg.wet_experience_scale_km);
    m.slope_sec_per_km *= (1.0 - reduction);
  }

  double window_km = 0.0;
  if (m.slope_sec_per_km > 1e-6) {
    window_km = cfg.window_delta_sec / m.slope_sec_per_km;
  } else {
    window_km = quantile(x, cfg.window_fallback_quantile).value_or(0.0);
  }
  window_km = std::min(window_km, quantile(x, cfg.window_cap_quantile).value_or(window_km));
  m.window_km = window_km;

  const double len = target.track_length_km > 0.0 ? target.track_length_km : kDefaultTrackLengthKm;
  // Round half to even.
  m.window_laps = std::max(1, static_cast<int>(std::nearbyint(window_km / len)));

  m.fresh_lap_time_sec = fresh_lap_time(laps, cfg.fresh_tyre_life_laps);
  m.sample_size = laps.size();
  return m;
}

} // namespace

std::vector<ScopeTier> default_scope_tiers(const std::string& driver, const std::string& team) {
  return {
    {"driver+team", [driver, team](const LapRecord& r){ return r.driver == driver && r.team == team; }},
    {"team",        [team](const LapRecord& r){ return r.team == team; }},
    {"all",         [](const LapRecord&){ return true; }},
  };
}

std::vector<LapRecord> scope_history(const LapHistory& history,
                                     const std::vector<ScopeTier>& tiers,
                                     std::string* chosen_tier) {
  for (const auto& tier : tiers) {
    std::vector<LapRecord> out;
    std::copy_if(history.begin(), history.end(), std::back_inserter(out), tier.matches);
    if (!out.empty()) {
      if (chosen_tier) *chosen_tier = tier.name;
      return out;
    }
  }
  if (chosen_tier) chosen_tier->clear();
  return {};
}

double compute_wet_experience_km(const LapHistory& history,
                                 int season_year,
                                 const std::string& driver,
                                 const std::string& team,
                                 TrackType track_type) {
  double km = 0.0;
  for (const auto& r : history) {
    if (r.year != season_year || r.driver != driver || r.team != team) continue;
    if (!r.is_wet || r.track_type != track_type) continue;
    km += r.track_length_km;
  }
  return km;
}

CompoundModels build_compound_models(const LapHistory& history,
                                     const FitTarget& target,
                                     const ModelConfig& cfg,
                                     LogSink* sink) {
  CompoundModels models;
  if (history.empty()) return models;

  std::string tier;
  const auto scoped = scope_history(history, default_scope_tiers(target.driver, target.team), &tier);
  log(sink, LogLevel::Info, "fitting compound models on " + std::to_string(scoped.size()) +
                            " laps (scope: " + tier + ")");

  const auto deltas = apply_lap_delta(scoped);
  for (Compound c : kAllCompounds) {
    std::vector<DeltaLap> laps;
    for (const auto& d : deltas) {
      if (d.rec->compound == c) laps.push_back(d);
    }
    if (laps.empty()) continue;

    const CompoundModel m = fit_compound(c, std::move(laps), target, cfg);
    std::ostringstream oss;
    oss << compound_name(c) << ": slope=" << m.slope_sec_per_km << " s/km, window="
        << m.window_laps << " laps, fresh=" << m.fresh_lap_time_sec << " s, n=" << m.sample_size;
    log(sink, LogLevel::Debug, oss.str());
    models.emplace(c, m);
  }
  return models;
}

} // namespace pitwall
