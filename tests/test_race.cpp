#include <catch2/catch.hpp>
#include <optional>
#include <vector>

#include <pitwall/stint.hpp>
#include <pitwall/race.hpp>

using Catch::Detail::Approx;
using namespace pitwall;

TEST_CASE("race_time: sum of pure stints") {
  std::vector<StintParams> stints{
    {3, 90.0, 0.2},  // time = 3*90 + 0.2*3*2/2 = 270 + 0.6 = 270.6
    {2, 91.0, 0.1}   // time = 2*91 + 0.1*2*1/2 = 182 + 0.1 = 182.1
  };
  auto total = race_time(stints);
  REQUIRE(total.has_value());
  REQUIRE(*total == Approx(270.6 + 182.1));
}

TEST_CASE("race_time_with_pits: adds pit loss between stints") {
  std::vector<StintParams> stints{
    {3, 90.0, 0.2},  // 270.6
    {2, 91.0, 0.1},  // 182.1
    {1, 92.0, 0.0}   // 92.0
  };
  auto total = race_time_with_pits(stints, 21.0);
  REQUIRE(total.has_value());
  REQUIRE(*total == Approx(270.6 + 182.1 + 92.0 + 2 * 21.0));
}

TEST_CASE("race_time_with_pits: one stint pays no pit loss") {
  std::vector<StintParams> stints{{10, 90.0, 0.0}};
  REQUIRE(*race_time_with_pits(stints, 21.0) == Approx(900.0));
}

TEST_CASE("race_time_with_pits: negative pit loss clamps to zero") {
  std::vector<StintParams> stints{{2, 90.0, 0.0}, {2, 90.0, 0.0}};
  REQUIRE(*race_time_with_pits(stints, -5.0) == Approx(360.0));
}

TEST_CASE("race_time: empty plan is rejected") {
  REQUIRE_FALSE(race_time({}).has_value());
  REQUIRE_FALSE(race_time_with_pits({}, 21.0).has_value());
}
