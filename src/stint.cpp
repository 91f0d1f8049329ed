#include <pitwall/stint.hpp>
#include <algorithm>

namespace pitwall {

double estimate_stint_time(const StintParams& p) {
  const int laps = std::max(0, p.laps);
  if (laps == 0 || p.freshLap <= 0.0 || p.degradationPerLap < 0.0) return 0.0;

  // Arithmetic series: sum_{i=0}^{n-1} (fresh + i*deg)
  // = n*fresh + deg * n*(n-1)/2
  const double n = static_cast<double>(laps);
  return n * p.freshLap + p.degradationPerLap * n * (n - 1.0) * 0.5;
}

} // namespace pitwall
