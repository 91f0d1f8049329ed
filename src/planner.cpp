#include <pitwall/planner.hpp>
#include <pitwall/errors.hpp>
#include <pitwall/team_names.hpp>
#include <sstream>

namespace pitwall {

RaceCondition infer_race_condition(const LapHistory& history, double wet_share_threshold) {
  if (history.empty()) return RaceCondition::Dry;
  return wet_lap_share(history) >= wet_share_threshold ? RaceCondition::Wet : RaceCondition::Dry;
}

StrategyPlan plan_strategy(HistoricalDataProvider& provider,
                           const PlanRequest& request,
                           const PlannerConfig& cfg,
                           LogSink* sink,
                           const std::vector<Track>& catalog) {
  StrategyPlan plan;
  plan.driver = request.driver;
  plan.team = normalize_team_name(request.team);
  plan.race_laps = request.race_laps;
  plan.pit_loss_sec = request.pit_loss_sec.value_or(cfg.pit_loss_sec);

  plan.target = resolve_target_context(provider, request.year, request.grand_prix, catalog);
  {
    std::ostringstream oss;
    oss << "target: " << plan.target.year << " " << plan.target.event_name << " (round "
        << plan.target.round_number << ", " << track_type_name(plan.target.track_type) << ", "
        << plan.target.track_length_km << " km)";
    log(sink, LogLevel::Info, oss.str());
  }

  // Phase 1: weighted history
  const LapHistory history = build_weighted_history(provider, plan.target, sink, catalog);
  if (history.empty()) {
    throw EmptyHistoryError("No historical race data could be loaded for " +
                            std::to_string(request.year) + " " + request.grand_prix + ".");
  }
  plan.history_rows = history.size();

  // Phase 2: compound models
  plan.wet_experience_km = compute_wet_experience_km(history, request.year, plan.driver, plan.team,
                                                     plan.target.track_type);
  FitTarget fit;
  fit.driver = plan.driver;
  fit.team = plan.team;
  fit.track_type = plan.target.track_type;
  fit.track_length_km = plan.target.track_length_km;
  fit.wet_experience_km = plan.wet_experience_km;
  plan.models = build_compound_models(history, fit, cfg.model, sink);
  if (plan.models.empty()) {
    throw NoCompoundModelsError("Unable to build compound models from available history.");
  }

  plan.condition = request.condition;
  if (plan.condition == RaceCondition::Auto) {
    plan.condition = infer_race_condition(history, cfg.wet_share_threshold);
    log(sink, LogLevel::Info, std::string("inferred race condition: ") +
                              race_condition_name(plan.condition));
  }

  // Phase 3: search and overstay cost
  plan.strategies = optimize_strategy(plan.models, plan.race_laps, plan.target.track_length_km,
                                      plan.condition, plan.pit_loss_sec, cfg.search);
  if (plan.strategies.empty()) {
    log(sink, LogLevel::Warning, "no feasible strategy found for " +
                                 std::to_string(plan.race_laps) + " laps");
  }
  plan.overstay = build_overstay_table(plan.models, plan.target.track_length_km, cfg.overstay_laps);
  return plan;
}

} // namespace pitwall
