#pragma once
#include <cstddef>

namespace pitwall {

struct StintParams {
  int laps = 0;                   // number of laps in the stint
  double freshLap = 0.0;          // lap time on a new set (seconds)
  double degradationPerLap = 0.0; // added seconds per lap of tyre age
};

// Returns total stint time in seconds: sum of freshLap + i*degradationPerLap
// for i = 0..laps-1.
double estimate_stint_time(const StintParams& p);

} // namespace pitwall
