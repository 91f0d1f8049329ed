#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <pitwall/compound.hpp>
#include <pitwall/config.hpp>
#include <pitwall/degradation.hpp>
#include <pitwall/history.hpp>
#include <pitwall/logging.hpp>
#include <pitwall/overstay.hpp>
#include <pitwall/strategy.hpp>

namespace pitwall {

struct PlanRequest {
  int year = 0;
  std::string grand_prix;
  std::string driver;
  std::string team;                          // raw; canonicalized by the planner
  int race_laps = 0;
  RaceCondition condition = RaceCondition::Auto;
  std::optional<double> pit_loss_sec;        // overrides PlannerConfig::pit_loss_sec
};

struct StrategyPlan {
  TargetContext target;
  std::string driver;
  std::string team;                          // canonical
  int race_laps = 0;
  RaceCondition condition = RaceCondition::Dry;   // resolved, never Auto
  double pit_loss_sec = 0.0;
  std::size_t history_rows = 0;
  CompoundModels models;
  double wet_experience_km = 0.0;
  std::vector<StrategyCandidate> strategies; // empty = no feasible strategy
  OverstayTable overstay;
};

// Wet when the share of wet laps in the history reaches the threshold.
RaceCondition infer_race_condition(const LapHistory& history, double wet_share_threshold);

// Full pipeline: target resolution, weighted history, wet experience,
// compound models, strategy search and overstay table.
// Throws DataUnavailableError (target cannot be resolved), EmptyHistoryError
// or NoCompoundModelsError; an empty strategy list is not an error.
StrategyPlan plan_strategy(HistoricalDataProvider& provider,
                           const PlanRequest& request,
                           const PlannerConfig& cfg = {},
                           LogSink* sink = nullptr,
                           const std::vector<Track>& catalog = track_catalog());

} // namespace pitwall
