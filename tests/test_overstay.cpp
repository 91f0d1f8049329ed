#include <catch2/catch.hpp>

#include <pitwall/overstay.hpp>

using Catch::Detail::Approx;
using namespace pitwall;

static CompoundModels models_with_slopes(double soft, double hard) {
  CompoundModels m;
  CompoundModel s;
  s.compound = Compound::Soft;
  s.slope_sec_per_km = soft;
  m.emplace(Compound::Soft, s);
  CompoundModel h;
  h.compound = Compound::Hard;
  h.slope_sec_per_km = hard;
  m.emplace(Compound::Hard, h);
  return m;
}

TEST_CASE("build_overstay_table accumulates the per-lap cost") {
  const auto table = build_overstay_table(models_with_slopes(0.02, 0.0), 5.0);
  REQUIRE(table.size() == 2);

  const auto& soft = table.at(Compound::Soft);
  REQUIRE(soft.size() == 10);
  REQUIRE(soft[0].extra_lap == 1);
  REQUIRE(soft[0].incremental_delta_sec == Approx(0.1));
  REQUIRE(soft[2].incremental_delta_sec == Approx(0.3));
  REQUIRE(soft[2].cumulative_delta_sec == Approx(0.6));
  REQUIRE(soft[9].extra_lap == 10);
  REQUIRE(soft[9].cumulative_delta_sec == Approx(5.5));
  for (std::size_t i = 1; i < soft.size(); ++i) {
    REQUIRE(soft[i].cumulative_delta_sec >= soft[i - 1].cumulative_delta_sec);
  }

  for (const auto& row : table.at(Compound::Hard)) {
    REQUIRE(row.incremental_delta_sec == Approx(0.0));
    REQUIRE(row.cumulative_delta_sec == Approx(0.0));
  }
}

TEST_CASE("build_overstay_table honors the lap count") {
  const auto models = models_with_slopes(0.02, 0.01);
  REQUIRE(build_overstay_table(models, 5.0, 3).at(Compound::Hard).size() == 3);
  REQUIRE(build_overstay_table(models, 5.0, 0).at(Compound::Soft).empty());
  REQUIRE(build_overstay_table({}, 5.0).empty());
}
