#pragma once
#include <optional>
#include <vector>

namespace pitwall {

// Round half away from zero to 3 decimals.
double round3(double v);

// Weighted median: sort by value, return the first value whose cumulative
// weight reaches half of the total. When the cumulative weight lands exactly
// on the half (even count, equal weights) the two straddling values are
// averaged, so equal weights reproduce the ordinary median.
// nullopt for empty input, size mismatch or non-positive total weight.
std::optional<double> weighted_median(const std::vector<double>& values,
                                      const std::vector<double>& weights);

// Quantile with linear interpolation between order statistics, q in [0,1].
std::optional<double> quantile(std::vector<double> values, double q);

struct LineFit {
  double slope = 0.0;
  double intercept = 0.0;
};

// Weighted least squares y ~ slope*x + intercept, minimizing sum (w*r)^2.
// nullopt when fewer than 2 points, sizes mismatch, x has no spread or the
// weights do not sum to a positive value.
std::optional<LineFit> weighted_linear_fit(const std::vector<double>& x,
                                           const std::vector<double>& y,
                                           const std::vector<double>& w);

} // namespace pitwall
