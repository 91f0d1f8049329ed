#include <catch2/catch.hpp>
#include <sstream>
#include <optional>
#include <vector>

#include <pitwall/track.hpp>

using Catch::Detail::Approx;
using namespace pitwall;

static std::string csv_minimal = R"(key,type,length_km
Bahrain International Circuit,Medium,5.412
Circuit de Monaco,Low,3.337
)";

static std::string csv_with_noise = R"( key , type , length_km
# comment lines are ignored
Bahrain International Circuit , Medium , 5.412
, , ,            # bad row skipped
Test Oval, Supersonic, 4.0
Short Loop, High, -1.0
Circuit de Monaco, low , 3.337
)";

TEST_CASE("track_catalog_from_csv_stream parses valid rows") {
  std::istringstream ss(csv_minimal);
  auto cat = track_catalog_from_csv_stream(ss);
  REQUIRE(cat.size() == 2);

  auto bah = track_by_key_in(cat, "Bahrain International Circuit");
  REQUIRE(bah.has_value());
  REQUIRE(bah->type == TrackType::Medium);
  REQUIRE(bah->length_km == Approx(5.412));

  auto mon = track_by_key_in(cat, "Circuit de Monaco");
  REQUIRE(mon.has_value());
  REQUIRE(mon->length_km == Approx(3.337));
}

TEST_CASE("track_catalog_from_csv_stream handles spaces, comments and bad rows") {
  std::istringstream ss(csv_with_noise);
  auto cat = track_catalog_from_csv_stream(ss);
  REQUIRE(cat.size() == 2);
  REQUIRE(track_by_key_in(cat, "Bahrain International Circuit").has_value());
  REQUIRE(track_by_key_in(cat, "Circuit de Monaco")->type == TrackType::Low);
  REQUIRE_FALSE(track_by_key_in(cat, "Test Oval").has_value());
}

TEST_CASE("track_info_in falls back to the default track") {
  std::istringstream ss(csv_minimal);
  auto cat = track_catalog_from_csv_stream(ss);
  const Track t = track_info_in(cat, "Silverstone Circuit");
  REQUIRE(t.type == TrackType::Medium);
  REQUIRE(t.length_km == Approx(5.0));
}

TEST_CASE("load_track_catalog_csv returns nullopt on missing file") {
  auto none = load_track_catalog_csv("this_file_does_not_exist.csv");
  REQUIRE_FALSE(none.has_value());
}
