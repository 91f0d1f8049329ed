#include <catch2/catch.hpp>
#include <numeric>
#include <string>
#include <vector>

#include <pitwall/errors.hpp>
#include <pitwall/planner.hpp>
#include "fake_provider.hpp"

using Catch::Detail::Approx;
using namespace pitwall;
using namespace pitwall::testing;

namespace {

const std::vector<ScheduleEntry> kSeason{
  {1, "Bahrain Grand Prix", "Bahrain International Circuit"},
  {2, "Saudi Arabian Grand Prix", "Jeddah Corniche Circuit"},
  {3, "Australian Grand Prix", "Albert Park Grand Prix Circuit"},
  {4, "Japanese Grand Prix", "Suzuka Circuit"},
};

// Every circuit 5 km so fitted slopes are exact.
std::vector<Track> flat_catalog() {
  std::vector<Track> cat;
  for (const auto& e : kSeason) cat.push_back(Track{e.circuit_name, TrackType::Medium, 5.0});
  return cat;
}

// Rounds 1-3 each carry a MEDIUM and a HARD stint for VER, in the given compounds.
FakeProvider provider_with(const std::string& first, const std::string& second) {
  FakeProvider p;
  p.schedules[2024] = kSeason;
  for (int round = 1; round <= 3; ++round) {
    const auto& e = kSeason[static_cast<std::size_t>(round - 1)];
    auto laps = stint_laps("VER", "Oracle Red Bull Racing", first, 1, 1, 20, 92.0, 0.07);
    const auto hard = stint_laps("VER", "Oracle Red Bull Racing", second, 2, 21, 30, 92.5, 0.04);
    laps.insert(laps.end(), hard.begin(), hard.end());
    p.add_session(make_session(2024, round, e.event_name, e.circuit_name, laps));
  }
  return p;
}

PlanRequest suzuka_request() {
  PlanRequest req;
  req.year = 2024;
  req.grand_prix = "Japanese Grand Prix";
  req.driver = "VER";
  req.team = "Red Bull";
  req.race_laps = 53;
  return req;
}

} // namespace

TEST_CASE("infer_race_condition") {
  REQUIRE(infer_race_condition({}, 0.25) == RaceCondition::Dry);

  LapHistory h{record("A", "T", Compound::Soft, 1, 90.0),
               record("A", "T", Compound::Medium, 1, 90.0),
               record("A", "T", Compound::Hard, 1, 90.0),
               record("A", "T", Compound::Wet, 1, 110.0)};
  REQUIRE(infer_race_condition(h, 0.25) == RaceCondition::Wet);
  REQUIRE(infer_race_condition(h, 0.3) == RaceCondition::Dry);
}

TEST_CASE("plan_strategy runs the full pipeline") {
  FakeProvider p = provider_with("MEDIUM", "HARD");
  const StrategyPlan plan = plan_strategy(p, suzuka_request(), PlannerConfig{}, nullptr,
                                          flat_catalog());

  REQUIRE(plan.target.round_number == 4);
  REQUIRE(plan.target.track_length_km == Approx(5.0));
  REQUIRE(plan.team == "Red Bull Racing");
  REQUIRE(plan.condition == RaceCondition::Dry);
  REQUIRE(plan.pit_loss_sec == Approx(21.0));
  REQUIRE(plan.history_rows == 150);
  REQUIRE(plan.wet_experience_km == Approx(0.0));

  REQUIRE(plan.models.size() == 2);
  const auto& medium = plan.models.at(Compound::Medium);
  REQUIRE(medium.slope_sec_per_km == Approx(0.014).margin(1e-9));
  REQUIRE(medium.window_laps == 17);
  REQUIRE(medium.sample_size == 60);
  const auto& hard = plan.models.at(Compound::Hard);
  REQUIRE(hard.slope_sec_per_km == Approx(0.008).margin(1e-9));
  REQUIRE(hard.window_laps == 27);

  REQUIRE_FALSE(plan.strategies.empty());
  REQUIRE(plan.strategies.size() <= 5);
  for (const auto& s : plan.strategies) {
    REQUIRE(std::accumulate(s.stint_laps.begin(), s.stint_laps.end(), 0) == 53);
  }

  REQUIRE(plan.overstay.size() == 2);
  REQUIRE(plan.overstay.at(Compound::Hard).size() == 10);
  REQUIRE(plan.overstay.at(Compound::Hard)[0].incremental_delta_sec == Approx(0.04));

  // Last year's race at the target is tried even though it is missing.
  bool asked_prev_year = false;
  for (const auto& key : p.requested) {
    if (key.first == 2023 && key.second == "Japanese Grand Prix") asked_prev_year = true;
  }
  REQUIRE(asked_prev_year);
}

TEST_CASE("plan_strategy honors request overrides") {
  FakeProvider p = provider_with("MEDIUM", "HARD");
  PlanRequest req = suzuka_request();
  req.pit_loss_sec = 30.0;
  req.condition = RaceCondition::Wet;

  const StrategyPlan plan = plan_strategy(p, req, PlannerConfig{}, nullptr, flat_catalog());
  REQUIRE(plan.pit_loss_sec == Approx(30.0));
  REQUIRE(plan.condition == RaceCondition::Wet);
  // No wet compound models, so nothing can be planned.
  REQUIRE(plan.strategies.empty());
  REQUIRE(plan.overstay.size() == 2);
}

TEST_CASE("plan_strategy infers a wet race from wet history") {
  FakeProvider p = provider_with("INTERMEDIATE", "WET");
  PlanRequest req = suzuka_request();
  req.race_laps = 45;

  const StrategyPlan plan = plan_strategy(p, req, PlannerConfig{}, nullptr, flat_catalog());
  REQUIRE(plan.condition == RaceCondition::Wet);
  REQUIRE(plan.wet_experience_km == Approx(750.0));
  REQUIRE(plan.models.count(Compound::Intermediate) == 1);
  REQUIRE(plan.models.count(Compound::Wet) == 1);
  for (const auto& s : plan.strategies) {
    for (Compound c : s.compounds) REQUIRE(is_wet_compound(c));
  }
}

TEST_CASE("plan_strategy errors") {
  SECTION("unknown grand prix") {
    FakeProvider p = provider_with("MEDIUM", "HARD");
    PlanRequest req = suzuka_request();
    req.grand_prix = "Monaco Grand Prix";
    REQUIRE_THROWS_AS(plan_strategy(p, req), DataUnavailableError);
  }
  SECTION("no usable history") {
    FakeProvider p;
    p.schedules[2024] = kSeason;
    REQUIRE_THROWS_AS(plan_strategy(p, suzuka_request()), EmptyHistoryError);
  }
}
