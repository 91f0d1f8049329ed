#include <catch2/catch.hpp>
#include <filesystem>
#include <fstream>

#include <pitwall/errors.hpp>
#include <pitwall/report.hpp>

using Catch::Detail::Approx;
using namespace pitwall;

namespace {

StrategyPlan sample_plan() {
  StrategyPlan plan;
  plan.target.year = 2024;
  plan.target.grand_prix = "Japan";
  plan.target.round_number = 4;
  plan.target.event_name = "Japanese Grand Prix";
  plan.target.circuit_name = "Suzuka Circuit";
  plan.target.track_type = TrackType::Medium;
  plan.target.track_length_km = 5.807;
  plan.driver = "VER";
  plan.team = "Red Bull Racing";
  plan.race_laps = 53;
  plan.condition = RaceCondition::Dry;
  plan.pit_loss_sec = 21.0;
  plan.history_rows = 150;

  CompoundModel medium;
  medium.compound = Compound::Medium;
  medium.slope_sec_per_km = 0.014;
  medium.window_km = 85.7;
  medium.window_laps = 15;
  medium.fresh_lap_time_sec = 92.0;
  medium.sample_size = 60;
  plan.models.emplace(Compound::Medium, medium);

  StrategyCandidate s;
  s.compounds = {Compound::Medium, Compound::Hard};
  s.stint_laps = {23, 30};
  s.stops = 1;
  s.predicted_total_time_sec = 4912.34567;
  plan.strategies.push_back(s);

  plan.overstay[Compound::Medium] = {{1, 0.0813, 0.0813}, {2, 0.1626, 0.24389}};
  return plan;
}

} // namespace

TEST_CASE("plan_to_json exposes every phase") {
  const auto doc = plan_to_json(sample_plan());

  REQUIRE(doc.contains("target"));
  REQUIRE(doc["target"]["event_name"] == "Japanese Grand Prix");
  REQUIRE(doc["target"]["team"] == "Red Bull Racing");
  REQUIRE(doc["target"]["track_type"] == "Medium");
  REQUIRE(doc["target"]["race_condition"] == "dry");
  REQUIRE(doc["target"]["race_laps"] == 53);

  REQUIRE(doc["phase_1_history_rows"] == 150);
  REQUIRE(doc["phase_2_compound_models"].contains("MEDIUM"));
  REQUIRE(doc["phase_2_compound_models"]["MEDIUM"]["window_laps"] == 15);
  REQUIRE(doc["phase_2_wet_experience_km"].get<double>() == Approx(0.0));

  const auto& best = doc["phase_3_best_strategies"];
  REQUIRE(best.is_array());
  REQUIRE(best.size() == 1);
  REQUIRE(best[0]["compounds"][1] == "HARD");
  REQUIRE(best[0]["stint_laps"][0] == 23);
  REQUIRE(best[0]["stops"] == 1);
  REQUIRE(best[0]["predicted_total_time_sec"].get<double>() == Approx(4912.346));

  const auto& overstay = doc["phase_3_overstay_delta"]["MEDIUM"];
  REQUIRE(overstay.size() == 2);
  REQUIRE(overstay[1]["extra_lap"] == 2);
  REQUIRE(overstay[1]["cumulative_delta_sec"].get<double>() == Approx(0.244));
}

TEST_CASE("an empty strategy list is still reported") {
  StrategyPlan plan = sample_plan();
  plan.strategies.clear();
  const auto doc = plan_to_json(plan);
  REQUIRE(doc["phase_3_best_strategies"].is_array());
  REQUIRE(doc["phase_3_best_strategies"].empty());
}

TEST_CASE("write_plan_json writes a parseable file") {
  const auto path = std::filesystem::temp_directory_path() / "pitwall_test_plan.json";
  write_plan_json(sample_plan(), path);

  std::ifstream f(path);
  REQUIRE(f.good());
  const auto doc = nlohmann::json::parse(f);
  REQUIRE(doc["target"]["driver"] == "VER");
  f.close();
  std::filesystem::remove(path);

  REQUIRE_THROWS_AS(write_plan_json(sample_plan(), "/nonexistent_dir/plan.json"), PitwallError);
}
