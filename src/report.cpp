#include <pitwall/report.hpp>
#include <pitwall/errors.hpp>
#include <pitwall/weighted_stats.hpp>
#include <fstream>

namespace pitwall {

using json = nlohmann::json;

static json target_json(const StrategyPlan& plan) {
  return json{
    {"year", plan.target.year},
    {"grand_prix", plan.target.grand_prix},
    {"event_name", plan.target.event_name},
    {"driver", plan.driver},
    {"team", plan.team},
    {"track_type", track_type_name(plan.target.track_type)},
    {"track_length_km", plan.target.track_length_km},
    {"race_laps", plan.race_laps},
    {"race_condition", race_condition_name(plan.condition)},
  };
}

static json models_json(const CompoundModels& models) {
  json out = json::object();
  for (const auto& [compound, m] : models) {
    out[compound_name(compound)] = json{
      {"slope_sec_per_km", m.slope_sec_per_km},
      {"intercept_sec", m.intercept_sec},
      {"window_km", m.window_km},
      {"window_laps", m.window_laps},
      {"fresh_lap_time_sec", m.fresh_lap_time_sec},
      {"sample_size", m.sample_size},
    };
  }
  return out;
}

static json strategies_json(const std::vector<StrategyCandidate>& strategies) {
  json out = json::array();
  for (const auto& s : strategies) {
    json compounds = json::array();
    for (Compound c : s.compounds) compounds.push_back(compound_name(c));
    out.push_back(json{
      {"compounds", compounds},
      {"stint_laps", s.stint_laps},
      {"stops", s.stops},
      {"predicted_total_time_sec", round3(s.predicted_total_time_sec)},
    });
  }
  return out;
}

static json overstay_json(const OverstayTable& table) {
  json out = json::object();
  for (const auto& [compound, rows] : table) {
    json arr = json::array();
    for (const auto& r : rows) {
      arr.push_back(json{
        {"extra_lap", r.extra_lap},
        {"incremental_delta_sec", round3(r.incremental_delta_sec)},
        {"cumulative_delta_sec", round3(r.cumulative_delta_sec)},
      });
    }
    out[compound_name(compound)] = std::move(arr);
  }
  return out;
}

json plan_to_json(const StrategyPlan& plan) {
  json doc;
  doc["target"] = target_json(plan);
  doc["phase_1_history_rows"] = plan.history_rows;
  doc["phase_2_compound_models"] = models_json(plan.models);
  doc["phase_2_wet_experience_km"] = round3(plan.wet_experience_km);
  doc["phase_3_best_strategies"] = strategies_json(plan.strategies);
  doc["phase_3_overstay_delta"] = overstay_json(plan.overstay);
  return doc;
}

void write_plan_json(const StrategyPlan& plan, const std::filesystem::path& path) {
  std::ofstream ofs(path);
  if (!ofs) throw PitwallError(PITWALL_LOC("failed to write: " + path.string()));
  ofs << plan_to_json(plan).dump(2) << "\n";
  if (!ofs) throw PitwallError(PITWALL_LOC("failed to write: " + path.string()));
}

} // namespace pitwall
