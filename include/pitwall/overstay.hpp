#pragma once
#include <map>
#include <vector>
#include <pitwall/compound.hpp>
#include <pitwall/degradation.hpp>

namespace pitwall {

struct OverstayRow {
  int extra_lap = 0;
  double incremental_delta_sec = 0.0;
  double cumulative_delta_sec = 0.0;
};

using OverstayTable = std::map<Compound, std::vector<OverstayRow>>;

inline constexpr int kDefaultOverstayLaps = 10;

// Cost of running each compound 1..max_extra_laps laps past its window:
// incremental = slope * track_length * extra_lap, cumulative = running sum.
OverstayTable build_overstay_table(const CompoundModels& models,
                                   double track_length_km,
                                   int max_extra_laps = kDefaultOverstayLaps);

} // namespace pitwall
