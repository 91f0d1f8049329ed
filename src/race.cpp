#include <pitwall/race.hpp>
#include <algorithm>

namespace pitwall {

std::optional<double> race_time(const std::vector<StintParams>& stints) {
  if (stints.empty()) return std::nullopt;
  double sum = 0.0;
  for (const auto& s : stints) {
    sum += estimate_stint_time(s);
  }
  return sum;
}

std::optional<double> race_time_with_pits(const std::vector<StintParams>& stints,
                                          double pit_loss_sec) {
  const auto driving = race_time(stints);
  if (!driving) return std::nullopt;
  const double stops = static_cast<double>(stints.size() - 1);
  return *driving + std::max(0.0, pit_loss_sec) * stops;
}

} // namespace pitwall
