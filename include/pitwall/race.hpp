#pragma once
#include <optional>
#include <vector>
#include <pitwall/stint.hpp>

namespace pitwall {

// Sum of stint times; nullopt for an empty plan.
std::optional<double> race_time(const std::vector<StintParams>& stints);

// Sum of stint times plus a fixed pit loss for each stop between stints.
// Negative pit loss clamps to zero.
std::optional<double> race_time_with_pits(const std::vector<StintParams>& stints,
                                          double pit_loss_sec);

} // namespace pitwall
